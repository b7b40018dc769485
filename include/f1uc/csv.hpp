#pragma once
#include <optional>
#include <string>
#include <vector>

namespace f1uc::csv {

std::string trim(std::string s);

// Simple CSV: no quoted fields. Each column is trimmed.
std::vector<std::string> split_line(const std::string& line);

// Blank lines and lines starting with '#' carry no data.
bool is_skippable(const std::string& raw);

// Whole-field numeric parses; nullopt if any trailing characters remain.
std::optional<double> to_double(const std::string& s);
std::optional<int> to_int(const std::string& s);

} // namespace f1uc::csv
