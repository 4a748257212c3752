#include "app/ControlLoop.hpp"
#include "app/EventLog.hpp"
#include "devices/DeviceTree.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Panels.hpp"
#include "ui/Terminal.hpp"
#include "ui/TerminalDisplay.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ignitor;

static void print_usage(std::ostream& os) {
  os << "Usage: ignitor [--config PATH] [--device-root DIR] [--iterations N] [-h|--help]\n";
  os << "Notes: click the panel buttons; q or Ctrl+C exits and switches every output off.\n";
}

static bool parse_count(const std::string& s, int& out) {
  std::size_t used = 0;
  try {
    int v = std::stoi(s, &used);
    if (used != s.size() || v < 0) return false;
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string device_root;
  int iterations = 0; // 0 => run until interrupted
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      print_usage(std::cout);
      return 0;
    } else if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "--device-root" && i + 1 < argc) {
      device_root = argv[++i];
    } else if (a == "--iterations" && i + 1 < argc) {
      if (!parse_count(argv[++i], iterations)) {
        std::fprintf(stderr, "ignitor: --iterations expects a non-negative integer, got '%s'\n", argv[i]);
        print_usage(std::cerr);
        return 2;
      }
    } else {
      std::fprintf(stderr, "ignitor: unrecognized argument '%s'\n", a.c_str());
      print_usage(std::cerr);
      return 2;
    }
  }

  ui::Config cfg = ui::load_config(config_path.empty() ? ui::config_file_path() : config_path);
  if (!device_root.empty()) cfg.devices.root = device_root;

  devices::DeviceTree tree(cfg.devices.root);
  std::vector<std::string> missing = tree.missing_required();
  if (!ui::tty_stdout()) missing.push_back("display terminal (stdout)");
  if (!missing.empty()) {
    for (const auto& m : missing)
      std::fprintf(stderr, "ignitor: required capability missing: %s\n", m.c_str());
    return 1;
  }

  auto laser = tree.make_energy_sensor();
  auto reactor = tree.make_reactor_sensor();
  auto bus = tree.make_bus();

  std::unique_ptr<app::EventLog> journal;
  if (!cfg.log.dir.empty()) {
    journal = std::make_unique<app::EventLog>(cfg.log.dir);
    journal->record("startup root=" + tree.root().string() + " bus=" + bus->name() +
                    (reactor ? " reactor=present" : " reactor=absent"));
  }

  std::signal(SIGINT, ui::on_signal);
  std::signal(SIGTERM, ui::on_signal);

  int handled = 0;
  {
    ui::RawTermGuard raw{};
    ui::CursorGuard curs{};
    ui::AltScreenGuard alt{cfg.ui.alt_screen};
    ui::MouseGuard mouse{};
    std::atexit(&ui::on_atexit_restore);

    ui::TerminalDisplay display;
    ui::TerminalInput input;
    app::Peripherals io{display, input, *bus, *laser, reactor.get()};
    app::ControlLoop loop(io, cfg, ui::use_unicode() ? ui::Glyphs::unicode() : ui::Glyphs::ascii(),
                          journal.get());
    handled = loop.run(iterations);
  }

  if (journal) journal->record("exit after " + std::to_string(handled) + " events");
  return 0;
}
