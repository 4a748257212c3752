#include "devices/DeviceTree.hpp"
#include "util/DeviceFs.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace ignitor::devices {

static bool is_dir(const fs::path& p) {
  std::error_code ec;
  return fs::is_directory(p, ec);
}

DeviceTree::DeviceTree(fs::path root) : root_(std::move(root)) {
  has_laser_ = is_dir(root_ / "laser");
  has_reactor_ = is_dir(root_ / "reactor");
  has_bus_ = is_dir(root_ / "bus");
}

std::vector<std::string> DeviceTree::missing_required() const {
  std::vector<std::string> out;
  if (!has_laser_) out.push_back("laser energy sensor (" + (root_ / "laser").string() + ")");
  if (!has_bus_) out.push_back("bundled output bus (" + (root_ / "bus").string() + ")");
  return out;
}

std::unique_ptr<IEnergySensor> DeviceTree::make_energy_sensor() const {
  if (!has_laser_) return nullptr;
  return std::make_unique<FileEnergySensor>(root_ / "laser");
}

std::unique_ptr<IReactorSensor> DeviceTree::make_reactor_sensor() const {
  if (!has_reactor_) return nullptr;
  return std::make_unique<FileReactorSensor>(root_ / "reactor");
}

std::unique_ptr<IBus> DeviceTree::make_bus() const {
  if (!has_bus_) return nullptr;
  return std::make_unique<FileBus>(root_ / "bus");
}

std::optional<double> FileEnergySensor::energy() {
  return util::read_number(dir_ / "energy");
}

std::optional<double> FileReactorSensor::plasma_heat() {
  return util::read_number(dir_ / "plasma_heat");
}

std::optional<double> FileReactorSensor::production() {
  return util::read_number(dir_ / "producing");
}

std::optional<bool> FileReactorSensor::ignited() {
  return util::read_flag(dir_ / "ignited");
}

std::optional<bool> FileReactorSensor::can_ignite() {
  return util::read_flag(dir_ / "can_ignite");
}

fs::path FileBus::channel_path(int side, int channel) const {
  return dir_ / ("side" + std::to_string(side)) / ("channel" + std::to_string(channel));
}

bool FileBus::set_channel(int side, int channel, std::uint8_t value) {
  auto path = channel_path(side, channel);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) return false;
  return util::write_file_string(path, std::to_string(static_cast<unsigned>(value)) + "\n");
}

} // namespace ignitor::devices
