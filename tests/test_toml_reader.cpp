#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using ignitor::util::TomlReader;

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("ignitor_test_toml_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  TomlReader tr;
  ASSERT_TRUE(!tr.load(tmp_path("nonexistent")));
}

TEST(toml_load_panel_config) {
  auto path = tmp_path("basic");
  write_file(path,
    "[bus]\n"
    "side = 3\n"
    "fire_channel = 5\n"
    "\n"
    "[ui]\n"
    "title = \"Fusion Lab\"\n"
    "alt_screen = false\n"
  );
  TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("bus", "side"), 3);
  ASSERT_EQ(tr.get_int("bus", "fire_channel"), 5);
  ASSERT_EQ(tr.get_string("ui", "title"), "Fusion Lab");
  ASSERT_EQ(tr.get_bool("ui", "alt_screen", true), false);
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  TomlReader tr;
  tr.load_string("[ui]\nalt_screen = true\n");
  ASSERT_EQ(tr.get_string("ui", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("ui", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("ui", "missing_bool", true), true);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
}

TEST(toml_has) {
  TomlReader tr;
  tr.load_string("[colors]\nwarn = \"#CC0000\"\n");
  ASSERT_TRUE(tr.has("colors", "warn"));
  ASSERT_TRUE(!tr.has("colors", "active"));
  ASSERT_TRUE(!tr.has("nosection", "warn"));
}

TEST(toml_bool_variants) {
  TomlReader tr;
  tr.load_string(
    "[b]\n"
    "a = true\n"
    "b = True\n"
    "c = 1\n"
    "d = false\n"
    "e = FALSE\n"
    "f = 0\n"
    "g = junk\n"
  );
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b"), true);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d", true), false);
  ASSERT_EQ(tr.get_bool("b", "e", true), false);
  ASSERT_EQ(tr.get_bool("b", "f", true), false);
  ASSERT_EQ(tr.get_bool("b", "g", true), true);
  ASSERT_EQ(tr.get_bool("b", "g", false), false);
}

TEST(toml_int_is_strict) {
  TomlReader tr;
  tr.load_string(
    "[n]\n"
    "pos = 42\n"
    "neg = -7\n"
    "str = hello\n"
    "tail = 12abc\n"
    "huge = 99999999999999\n"
  );
  ASSERT_EQ(tr.get_int("n", "pos"), 42);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  ASSERT_EQ(tr.get_int("n", "tail", 99), 99);
  ASSERT_EQ(tr.get_int("n", "huge", 99), 99);
}

TEST(toml_trailing_comments) {
  TomlReader tr;
  tr.load_string(
    "[timing]\n"
    "poll_ms = 250   # redraw period\n"
    "[colors]\n"
    "active = \"#00FF00\" # green\n"
  );
  ASSERT_EQ(tr.get_int("timing", "poll_ms"), 250);
  ASSERT_EQ(tr.get_string("colors", "active"), "#00FF00");
}

TEST(toml_comments_and_whitespace) {
  TomlReader tr;
  tr.load_string(
    "# Top-level comment\n"
    "\n"
    "[ laser ]  \n"
    "  required_meu  =  90  \n"
    "# inline section comment\n"
    "  eu_per_meu = 1000\n"
  );
  ASSERT_EQ(tr.get_int("laser", "required_meu"), 90);
  ASSERT_EQ(tr.get_int("laser", "eu_per_meu"), 1000);
}

TEST(toml_last_assignment_wins) {
  TomlReader tr;
  tr.load_string("[bus]\nside = 1\nside = 4\n");
  ASSERT_EQ(tr.get_int("bus", "side"), 4);
}

TEST(toml_global_keys_no_section) {
  TomlReader tr;
  tr.load_string("key = value\n[sec]\nother = 1\n");
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);
}
