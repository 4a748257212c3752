#pragma once

#include <cstdint>
#include <string>

#include "model/Actuators.hpp"

namespace ignitor::ui {

// 0xRRGGBB colors used by the dashboard.
struct Palette {
  std::uint32_t active{0x00CC00};
  std::uint32_t inactive{0x333333};
  std::uint32_t warn{0xCC0000};
  std::uint32_t ready{0x00CCCC};
  std::uint32_t background{0x000000};
  std::uint32_t text{0xFFFFFF};
  std::uint32_t graph_power{0x00A0FF};
  std::uint32_t graph_heat{0xFF8000};
  std::uint32_t button{0x444444};        // enabled button with no state color
  std::uint32_t on_text{0x000000};       // text on an active/ready block
  std::uint32_t disabled_text{0xAAAAAA}; // disabled buttons, unknown indicators
};

struct Config {
  model::BusChannels bus{};

  struct Laser {
    int required_meu{125};
    int eu_per_meu{10'000'000};
    [[nodiscard]] double required_eu() const {
      return static_cast<double>(required_meu) * static_cast<double>(eu_per_meu);
    }
  } laser;

  struct History {
    int max_samples{400};
  } history;

  struct Timing {
    int poll_ms{300};
    int pulse_ms{300};
    int message_secs{8};
  } timing;

  Palette colors{};

  struct UI {
    std::string title{"Reactor Control"};
    bool alt_screen{true};
  } ui;

  struct Devices {
    std::string root{"/run/ignitor"};
  } devices;

  struct Log {
    std::string dir; // empty: event journal disabled
  } log;
};

// Environment variable helpers (accept IGNITOR_ and ignitor_ prefixes)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

// $XDG_CONFIG_HOME/ignitor/config.toml, else ~/.config/ignitor/config.toml
std::string config_file_path();

// Resolve every key TOML -> env -> compiled default. A missing or
// unreadable file is not an error; all keys then come from env/defaults.
Config load_config(const std::string& path);

} // namespace ignitor::ui
