#include <f1uc/csv.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace f1uc::csv {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

bool is_skippable(const std::string& raw) {
  return raw.empty() || raw[0] == '#';
}

std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<int> to_int(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    std::size_t idx = 0;
    const int v = std::stoi(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace f1uc::csv
