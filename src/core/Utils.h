#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <optional>

namespace lan_scan {
namespace utils {

// Best-effort file helpers: unreadable files yield empty / nullopt, never throw.
std::vector<std::string> read_lines(const std::string& path);
std::optional<std::string> read_file(const std::string& path, size_t max_bytes = 16 * 1024 * 1024);

std::string trim(const std::string& s);
std::vector<std::string> split_ws(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim); // keeps empty fields
std::vector<std::string> split_csv(const std::string& s);         // drops empty fields
std::string to_upper(std::string s);
std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);

// UTC, second precision: 2025-01-01T00:00:00Z
std::string time_to_iso(std::chrono::system_clock::time_point tp);

// PATH lookup without executing anything. sbin directories are always
// searched since arp-scan and friends usually live there.
std::optional<std::string> find_in_path(const std::string& name);

}
}
