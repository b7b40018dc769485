#pragma once
#include <string>
#include <vector>
#include <f1uc/observation.hpp>

namespace f1uc::testing {

// Degradation: for ages 1..10, one lap 0.05 s above and one 0.05 s below
// slope_per_lap * age. OLS recovers the slope exactly.
inline std::vector<Observation> degradation_obs(const std::string& circuit, int season,
                                                Compound c, double slope_per_lap = 0.1) {
  std::vector<Observation> out;
  for (int age = 1; age <= 10; ++age) {
    const double v = slope_per_lap * age;
    out.push_back({Family::Degradation, circuit, season, c, age, v + 0.05});
    out.push_back({Family::Degradation, circuit, season, c, age, v - 0.05});
  }
  return out;
}

// Pit losses symmetric around `mean` (small spread).
inline std::vector<Observation> pit_obs(const std::string& circuit, int season,
                                        Compound c, double mean = 22.0) {
  std::vector<Observation> out;
  for (double d : {-0.1, 0.1, -0.05, 0.05, 0.0, 0.0}) {
    out.push_back({Family::PitLoss, circuit, season, c, 0, mean + d});
  }
  return out;
}

// Out-lap deltas symmetric around `mean`.
inline std::vector<Observation> outlap_obs(const std::string& circuit, int season,
                                           Compound c, double mean = 0.8) {
  std::vector<Observation> out;
  for (double d : {-0.1, 0.1, -0.05, 0.05, 0.0, 0.0}) {
    out.push_back({Family::OutLap, circuit, season, c, 1, mean + d});
  }
  return out;
}

inline std::vector<Observation> full_dataset(const std::string& circuit, int season, Compound c) {
  auto all = degradation_obs(circuit, season, c);
  for (const auto& o : pit_obs(circuit, season, c)) all.push_back(o);
  for (const auto& o : outlap_obs(circuit, season, c)) all.push_back(o);
  return all;
}

} // namespace f1uc::testing
