// ============= include/rollcall/core/utils.hpp =============
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rollcall {

std::string trim(const std::string& s);
std::string to_upper(std::string s);
std::string to_lower(std::string s);

// "%Y-%m-%d %H:%M:%S" en UTC
std::string now_timestamp();
std::string format_timestamp(std::chrono::system_clock::time_point tp);
int64_t unix_seconds(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

std::vector<std::string> split_whitespace(const std::string& s);

} // namespace rollcall
