// Helpers for the file-backed device tree (one value per file, sysfs style)
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace ignitor::util {

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::filesystem::path& p) -> std::optional<std::string>;

// Read a single finite number. Missing, empty, garbage or NaN/Inf -> nullopt.
auto read_number(const std::filesystem::path& p) -> std::optional<double>;

// Read a flag: 1/0/true/false (any case). Anything else -> nullopt.
auto read_flag(const std::filesystem::path& p) -> std::optional<bool>;

// Truncate and rewrite the file with content. False if it did not land.
[[nodiscard]] bool write_file_string(const std::filesystem::path& p, const std::string& content);

} // namespace ignitor::util
