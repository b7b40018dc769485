#include <f1uc/compound.hpp>
#include <algorithm>
#include <cctype>

namespace f1uc {

std::string to_upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::string circuit_key(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<Compound> parse_compound(const std::string& s) {
  const auto u = to_upper(s);
  if (u == "SOFT"   || u == "S") return Compound::Soft;
  if (u == "MEDIUM" || u == "M") return Compound::Medium;
  if (u == "HARD"   || u == "H") return Compound::Hard;
  return std::nullopt;
}

const char* compound_name(Compound c) {
  switch (c) {
    case Compound::Soft:   return "SOFT";
    case Compound::Medium: return "MEDIUM";
    case Compound::Hard:   return "HARD";
  }
  return "UNKNOWN";
}

} // namespace f1uc
