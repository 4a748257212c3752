#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace ignitor::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("IGNITOR_", 0) == 0) {
    alt = std::string("ignitor_") + n.substr(8);
  } else if (n.rfind("ignitor_", 0) == 0) {
    alt = std::string("IGNITOR_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/ignitor/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/ignitor/config.toml";
  return {};
}

// Resolve a color from TOML "#RRGGBB" -> compiled default.
static std::uint32_t resolve_color(const ignitor::util::TomlReader& toml, bool have_toml,
                                   const char* key, std::uint32_t def) {
  if (have_toml && toml.has("colors", key)) {
    std::string val = toml.get_string("colors", key);
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b))
      return (static_cast<std::uint32_t>(r) << 16) | (static_cast<std::uint32_t>(g) << 8) | static_cast<std::uint32_t>(b);
    std::fprintf(stderr, "ignitor: config: colors.%s rejected (expected #RRGGBB): %s\n", key, val.c_str());
  }
  return def;
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const ignitor::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const ignitor::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const ignitor::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  const Config d{};
  ignitor::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [bus] ---
  c.bus.side   = std::max(0, resolve_int(toml, have_toml, "bus", "side",           "IGNITOR_BUS_SIDE",       d.bus.side));
  c.bus.fire   = std::clamp(resolve_int(toml, have_toml, "bus", "fire_channel",   "IGNITOR_FIRE_CHANNEL",   d.bus.fire), 0, 255);
  c.bus.charge = std::clamp(resolve_int(toml, have_toml, "bus", "charge_channel", "IGNITOR_CHARGE_CHANNEL", d.bus.charge), 0, 255);
  c.bus.fuel   = std::clamp(resolve_int(toml, have_toml, "bus", "fuel_channel",   "IGNITOR_FUEL_CHANNEL",   d.bus.fuel), 0, 255);
  c.bus.cavity = std::clamp(resolve_int(toml, have_toml, "bus", "cavity_channel", "IGNITOR_CAVITY_CHANNEL", d.bus.cavity), 0, 255);

  // --- [laser] ---
  c.laser.required_meu = std::max(0, resolve_int(toml, have_toml, "laser", "required_meu", "IGNITOR_REQUIRED_MEU", d.laser.required_meu));
  c.laser.eu_per_meu   = std::max(1, resolve_int(toml, have_toml, "laser", "eu_per_meu",   nullptr,                d.laser.eu_per_meu));

  // --- [history] ---
  c.history.max_samples = std::max(1, resolve_int(toml, have_toml, "history", "max_samples", "IGNITOR_MAX_HISTORY", d.history.max_samples));

  // --- [timing] ---
  c.timing.poll_ms      = std::clamp(resolve_int(toml, have_toml, "timing", "poll_ms",      "IGNITOR_POLL_MS",  d.timing.poll_ms), 10, 5000);
  c.timing.pulse_ms     = std::clamp(resolve_int(toml, have_toml, "timing", "pulse_ms",     "IGNITOR_PULSE_MS", d.timing.pulse_ms), 0, 10000);
  c.timing.message_secs = std::max(0, resolve_int(toml, have_toml, "timing", "message_secs", nullptr,           d.timing.message_secs));

  // --- [colors] ---
  c.colors.active      = resolve_color(toml, have_toml, "active",      d.colors.active);
  c.colors.inactive    = resolve_color(toml, have_toml, "inactive",    d.colors.inactive);
  c.colors.warn        = resolve_color(toml, have_toml, "warn",        d.colors.warn);
  c.colors.ready       = resolve_color(toml, have_toml, "ready",       d.colors.ready);
  c.colors.background  = resolve_color(toml, have_toml, "background",  d.colors.background);
  c.colors.text        = resolve_color(toml, have_toml, "text",        d.colors.text);
  c.colors.graph_power = resolve_color(toml, have_toml, "graph_power", d.colors.graph_power);
  c.colors.graph_heat  = resolve_color(toml, have_toml, "graph_heat",  d.colors.graph_heat);
  c.colors.button        = resolve_color(toml, have_toml, "button",        d.colors.button);
  c.colors.on_text       = resolve_color(toml, have_toml, "on_text",       d.colors.on_text);
  c.colors.disabled_text = resolve_color(toml, have_toml, "disabled_text", d.colors.disabled_text);

  // --- [ui] ---
  c.ui.title      = resolve_string(toml, have_toml, "ui", "title",      "IGNITOR_TITLE",      d.ui.title);
  c.ui.alt_screen = resolve_bool(toml, have_toml,   "ui", "alt_screen", "IGNITOR_ALT_SCREEN", d.ui.alt_screen);

  // --- [devices] / [log] ---
  c.devices.root = resolve_string(toml, have_toml, "devices", "root", "IGNITOR_DEVICE_ROOT", d.devices.root);
  c.log.dir      = resolve_string(toml, have_toml, "log",     "dir",  "IGNITOR_LOG_DIR",     d.log.dir);

  return c;
}

} // namespace ignitor::ui
