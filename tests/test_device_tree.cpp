#include "minitest.hpp"
#include "devices/DeviceTree.hpp"
#include "util/DeviceFs.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace ignitor;

static fs::path test_root(const char* suffix) {
  auto p = fs::temp_directory_path() /
           ("ignitor_devtree_test_" + std::to_string(::getpid()) + "_" + suffix);
  fs::remove_all(p);
  return p;
}

static void put(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p);
  f << content;
}

static std::string slurp(const fs::path& p) {
  auto s = util::read_file_string(p);
  return s ? *s : std::string("<missing>");
}

TEST(device_tree_reports_missing_required) {
  auto root = test_root("empty");
  fs::create_directories(root);
  devices::DeviceTree tree(root);
  auto missing = tree.missing_required();
  ASSERT_EQ(missing.size(), 2u);
  ASSERT_TRUE(missing[0].starts_with("laser energy sensor ("));
  ASSERT_TRUE(missing[1].starts_with("bundled output bus ("));
  ASSERT_TRUE(tree.make_energy_sensor() == nullptr);
  ASSERT_TRUE(tree.make_bus() == nullptr);
  fs::remove_all(root);
}

TEST(device_tree_full_apparatus) {
  auto root = test_root("full");
  put(root / "laser" / "energy", "1250000000\n");
  put(root / "reactor" / "plasma_heat", "2.5e8");
  put(root / "reactor" / "producing", "  420 \n");
  put(root / "reactor" / "ignited", "TRUE\n");
  put(root / "reactor" / "can_ignite", "0");
  fs::create_directories(root / "bus");

  devices::DeviceTree tree(root);
  ASSERT_TRUE(tree.missing_required().empty());
  ASSERT_TRUE(tree.has_reactor());

  auto laser = tree.make_energy_sensor();
  ASSERT_EQ(*laser->energy(), 1.25e9);

  auto reactor = tree.make_reactor_sensor();
  ASSERT_TRUE(reactor != nullptr);
  ASSERT_EQ(*reactor->plasma_heat(), 2.5e8);
  ASSERT_EQ(*reactor->production(), 420.0);
  ASSERT_EQ(*reactor->ignited(), true);
  ASSERT_EQ(*reactor->can_ignite(), false);
  fs::remove_all(root);
}

TEST(device_tree_absent_reactor) {
  auto root = test_root("noreactor");
  put(root / "laser" / "energy", "0");
  fs::create_directories(root / "bus");
  devices::DeviceTree tree(root);
  ASSERT_TRUE(!tree.has_reactor());
  ASSERT_TRUE(tree.make_reactor_sensor() == nullptr);
  fs::remove_all(root);
}

TEST(sensor_faults_read_as_no_value) {
  auto root = test_root("faults");
  put(root / "laser" / "energy", "not a number");
  put(root / "reactor" / "plasma_heat", "");
  put(root / "reactor" / "ignited", "maybe");
  fs::create_directories(root / "bus");
  devices::DeviceTree tree(root);

  ASSERT_TRUE(!tree.make_energy_sensor()->energy().has_value());
  auto reactor = tree.make_reactor_sensor();
  ASSERT_TRUE(!reactor->plasma_heat().has_value());
  ASSERT_TRUE(!reactor->production().has_value()); // file missing
  ASSERT_TRUE(!reactor->ignited().has_value());
  ASSERT_TRUE(!reactor->can_ignite().has_value());

  put(root / "laser" / "energy", "inf");
  ASSERT_TRUE(!tree.make_energy_sensor()->energy().has_value());
  fs::remove_all(root);
}

TEST(file_bus_writes_channel_files) {
  auto root = test_root("bus");
  put(root / "laser" / "energy", "0");
  fs::create_directories(root / "bus");
  devices::DeviceTree tree(root);
  auto bus = tree.make_bus();

  ASSERT_TRUE(bus->set_channel(2, 10, 255));
  ASSERT_EQ(slurp(root / "bus" / "side2" / "channel10"), "255\n");
  ASSERT_TRUE(bus->set_channel(2, 10, 0));
  ASSERT_EQ(slurp(root / "bus" / "side2" / "channel10"), "0\n");
  fs::remove_all(root);
}

TEST(file_bus_reports_write_failure) {
  auto root = test_root("busfail");
  fs::create_directories(root / "bus");
  // A regular file where the side directory should be
  put(root / "bus" / "side2", "x");
  devices::FileBus bus(root / "bus");
  ASSERT_TRUE(!bus.set_channel(2, 1, 255));
  fs::remove_all(root);
}
