#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Actuators.hpp"
#include <stdexcept>

using namespace ignitor;
using std::chrono::milliseconds;

static app::ActuatorController make_controller(fakes::RecordingBus& bus, std::vector<milliseconds>* slept = nullptr) {
  return app::ActuatorController(bus, model::BusChannels{}, milliseconds(300), nullptr,
                                 [slept](milliseconds d) { if (slept) slept->push_back(d); });
}

TEST(push_outputs_writes_all_three_channels) {
  fakes::RecordingBus bus;
  auto ctl = make_controller(bus);
  ctl.push_outputs();
  ASSERT_EQ(bus.writes.size(), 3u);
  ASSERT_TRUE((bus.writes[0] == fakes::BusWrite{2, 1, 0}));
  ASSERT_TRUE((bus.writes[1] == fakes::BusWrite{2, 10, 0}));
  ASSERT_TRUE((bus.writes[2] == fakes::BusWrite{2, 12, 0}));
}

TEST(toggle_fuel_pushes_and_reports) {
  fakes::RecordingBus bus;
  auto ctl = make_controller(bus);
  ctl.toggle_fuel();
  ASSERT_TRUE(ctl.state().fuel_open);
  ASSERT_EQ(bus.writes.size(), 3u);
  ASSERT_EQ(*bus.last_for(10), 255);
  ASSERT_EQ(*bus.last_for(1), 0);
  ASSERT_EQ(ctl.message().text, "Fuel: ON");
}

TEST(toggle_fuel_twice_restores_bus_value) {
  fakes::RecordingBus bus;
  auto ctl = make_controller(bus);
  ctl.toggle_fuel();
  ctl.toggle_fuel();
  ASSERT_TRUE(!ctl.state().fuel_open);
  ASSERT_EQ(bus.count_for(10), 2);
  ASSERT_EQ(*bus.last_for(10), 0);
  ASSERT_EQ(ctl.message().text, "Fuel: OFF");
}

TEST(toggle_charging_and_cavity_messages) {
  fakes::RecordingBus bus;
  auto ctl = make_controller(bus);
  ctl.toggle_charging();
  ASSERT_EQ(ctl.message().text, "Charging: ON");
  ASSERT_EQ(*bus.last_for(1), 255);
  ctl.toggle_cavity();
  ASSERT_EQ(ctl.message().text, "Cavity: ON");
  ASSERT_EQ(*bus.last_for(12), 255);
  ASSERT_TRUE(ctl.state().charging);
}

TEST(ignite_refused_without_energy) {
  fakes::RecordingBus bus;
  std::vector<milliseconds> slept;
  auto ctl = make_controller(bus, &slept);
  ASSERT_TRUE(ctl.try_ignite(false) == app::IgniteResult::InsufficientEnergy);
  ASSERT_EQ(ctl.message().text, "Not enough energy.");
  ASSERT_TRUE(bus.writes.empty());
  ASSERT_TRUE(slept.empty());
}

TEST(ignite_pulses_fire_channel) {
  fakes::RecordingBus bus;
  std::vector<milliseconds> slept;
  auto ctl = make_controller(bus, &slept);
  ctl.toggle_fuel();
  bus.writes.clear();

  ASSERT_TRUE(ctl.try_ignite(true) == app::IgniteResult::Fired);
  ASSERT_EQ(bus.writes.size(), 2u);
  ASSERT_TRUE((bus.writes[0] == fakes::BusWrite{2, 4, 255}));
  ASSERT_TRUE((bus.writes[1] == fakes::BusWrite{2, 4, 0}));
  ASSERT_EQ(slept.size(), 1u);
  ASSERT_EQ(slept[0].count(), 300);
  ASSERT_EQ(ctl.message().text, "Ignition triggered.");
  ASSERT_TRUE(ctl.state().fuel_open);
}

TEST(pulse_ends_low_when_dwell_throws) {
  fakes::RecordingBus bus;
  app::ActuatorController ctl(bus, model::BusChannels{}, milliseconds(300), nullptr,
                              [](milliseconds) { throw std::runtime_error("dwell interrupted"); });
  bool threw = false;
  try {
    (void)ctl.try_ignite(true);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  ASSERT_TRUE(threw);
  ASSERT_EQ(bus.writes.size(), 2u);
  ASSERT_EQ(*bus.last_for(4), 0);
}

TEST(interlock_forces_charging_off) {
  fakes::RecordingBus bus;
  auto ctl = make_controller(bus);
  ctl.toggle_charging();
  bus.writes.clear();

  ASSERT_TRUE(!ctl.enforce_interlock(false));
  ASSERT_TRUE(ctl.state().charging);
  ASSERT_TRUE(bus.writes.empty());

  ASSERT_TRUE(ctl.enforce_interlock(true));
  ASSERT_TRUE(!ctl.state().charging);
  ASSERT_EQ(bus.writes.size(), 3u);
  ASSERT_EQ(*bus.last_for(1), 0);
  ASSERT_EQ(ctl.message().text, "Laser charged - charging OFF.");

  // Already off: nothing more to do
  ASSERT_TRUE(!ctl.enforce_interlock(true));
  ASSERT_EQ(bus.writes.size(), 3u);
}

TEST(shutdown_turns_everything_off) {
  fakes::RecordingBus bus;
  auto ctl = make_controller(bus);
  ctl.toggle_charging();
  ctl.toggle_fuel();
  ctl.toggle_cavity();
  ctl.shutdown();
  ASSERT_TRUE(!ctl.state().charging);
  ASSERT_TRUE(!ctl.state().fuel_open);
  ASSERT_TRUE(!ctl.state().cavity_open);
  ASSERT_EQ(*bus.last_for(1), 0);
  ASSERT_EQ(*bus.last_for(10), 0);
  ASSERT_EQ(*bus.last_for(12), 0);
}

TEST(failed_bus_writes_are_counted) {
  fakes::RecordingBus bus;
  bus.fail = true;
  auto ctl = make_controller(bus);
  ctl.toggle_fuel();
  ASSERT_TRUE(ctl.state().fuel_open);
  ASSERT_EQ(ctl.bus_faults(), 1);
  ASSERT_EQ(bus.writes.size(), 3u);
}

TEST(ignite_with_failed_bus_is_not_reported_as_fired) {
  fakes::RecordingBus bus;
  bus.fail = true;
  std::vector<milliseconds> slept;
  auto ctl = make_controller(bus, &slept);
  ASSERT_TRUE(ctl.try_ignite(true) == app::IgniteResult::BusFault);
  // high and low both failed
  ASSERT_EQ(ctl.bus_faults(), 2);
  ASSERT_EQ(bus.writes.size(), 2u);
  ASSERT_EQ(*bus.last_for(4), 0);
  ASSERT_EQ(slept.size(), 1u);
  ASSERT_EQ(ctl.message().text, "Ignition failed: bus write.");
}

TEST(custom_channels_are_respected) {
  fakes::RecordingBus bus;
  model::BusChannels ch{};
  ch.side = 5;
  ch.fuel = 3;
  app::ActuatorController ctl(bus, ch, milliseconds(0), nullptr, [](milliseconds) {});
  ctl.toggle_fuel();
  ASSERT_TRUE((bus.writes[1] == fakes::BusWrite{5, 3, 255}));
}
