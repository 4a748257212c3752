#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "devices/IBus.hpp"
#include "devices/ISensors.hpp"

namespace ignitor::devices {

// The simulated apparatus as a sysfs-style directory tree:
//
//   <root>/laser/energy                   EU (required)
//   <root>/reactor/{plasma_heat,producing,ignited,can_ignite}   (optional)
//   <root>/bus/side<S>/channel<C>         0..255, rewritten on every set
//
// Presence is probed when the tree is opened and never re-probed.
class DeviceTree {
public:
  explicit DeviceTree(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] bool has_laser() const { return has_laser_; }
  [[nodiscard]] bool has_reactor() const { return has_reactor_; }
  [[nodiscard]] bool has_bus() const { return has_bus_; }

  // "name (path)" for each required capability that is absent.
  [[nodiscard]] std::vector<std::string> missing_required() const;

  [[nodiscard]] std::unique_ptr<IEnergySensor> make_energy_sensor() const;
  // nullptr when no reactor adapter is installed.
  [[nodiscard]] std::unique_ptr<IReactorSensor> make_reactor_sensor() const;
  [[nodiscard]] std::unique_ptr<IBus> make_bus() const;

private:
  std::filesystem::path root_;
  bool has_laser_{false};
  bool has_reactor_{false};
  bool has_bus_{false};
};

class FileEnergySensor final : public IEnergySensor {
public:
  explicit FileEnergySensor(std::filesystem::path laser_dir) : dir_(std::move(laser_dir)) {}
  [[nodiscard]] std::optional<double> energy() override;
private:
  std::filesystem::path dir_;
};

class FileReactorSensor final : public IReactorSensor {
public:
  explicit FileReactorSensor(std::filesystem::path reactor_dir) : dir_(std::move(reactor_dir)) {}
  [[nodiscard]] std::optional<double> plasma_heat() override;
  [[nodiscard]] std::optional<double> production() override;
  [[nodiscard]] std::optional<bool> ignited() override;
  [[nodiscard]] std::optional<bool> can_ignite() override;
private:
  std::filesystem::path dir_;
};

class FileBus final : public IBus {
public:
  explicit FileBus(std::filesystem::path bus_dir) : dir_(std::move(bus_dir)) {}
  [[nodiscard]] bool set_channel(int side, int channel, std::uint8_t value) override;
  [[nodiscard]] const char* name() const override { return "file"; }

  [[nodiscard]] std::filesystem::path channel_path(int side, int channel) const;
private:
  std::filesystem::path dir_;
};

} // namespace ignitor::devices
