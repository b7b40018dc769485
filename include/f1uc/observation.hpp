#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <f1uc/compound.hpp>

namespace f1uc {

// The three model families fitted per request.
enum class Family : int {
  Degradation = 0, // lap-time delta vs fresh tires, as a function of tire age
  PitLoss = 1,     // total time lost to a stop (entry + stationary + exit)
  OutLap = 2       // pace delta on the first lap on new tires
};

const char* family_name(Family f);
std::optional<Family> parse_family(const std::string& s);

// One historical record. value_s is interpreted per family.
struct Observation {
  Family family = Family::Degradation;
  std::string circuit;      // circuit_key() form, e.g. "bahrain"
  int season = 0;
  Compound compound = Compound::Medium;
  int tire_age = 0;         // laps on the set
  double value_s = 0.0;     // seconds
};

// Plausibility caps per family (seconds). Values above are treated as malformed.
double value_cap(Family f);

// Finite, non-negative value below the family cap, non-negative tire age.
bool is_usable(const Observation& o);

std::vector<Observation> filter_usable(const std::vector<Observation>& in);

// Stream loader. Columns: family,circuit,season,compound,tire_age,value_s.
// Optional header row; '#' comments and blank lines are ignored; invalid rows are skipped.
// Malformed values are kept here (the fitter filters them) so counts stay observable.
std::vector<Observation> observations_from_csv_stream(std::istream& in);

// Filesystem wrapper; nullopt if the file cannot be opened.
std::optional<std::vector<Observation>> load_observations_csv(const std::string& path);

} // namespace f1uc
