#pragma once
#include <optional>
#include <string>

namespace f1uc {

enum class Compound : int {
  Soft = 0,
  Medium = 1,
  Hard = 2
};

// Accepts "SOFT", "MEDIUM", "HARD" and the single-letter forms (case-insensitive).
std::optional<Compound> parse_compound(const std::string& s);

const char* compound_name(Compound c);

// Upper-cases ASCII letters; used for compound names and enum-like fields.
std::string to_upper(std::string s);

// Lower-cases and trims; circuits are matched on this form ("Bahrain" == " bahrain").
std::string circuit_key(std::string s);

} // namespace f1uc
