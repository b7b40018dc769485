#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace f1uc {

struct Circuit {
  std::string key;          // circuit_key() form, e.g. "bahrain"
  double pit_stationary_s;  // seconds at box
  double pit_lane_delta_s;  // pit-lane delta vs racing line
};

// Nominal green-flag stop loss: stationary + lane, negatives clamped to zero.
double circuit_pit_loss(const Circuit& c);

// Built-in catalog (default/fallback).
const std::vector<Circuit>& circuit_catalog();

// Lookups are case-insensitive.
std::optional<Circuit> circuit_by_key(const std::string& key);
std::optional<Circuit> circuit_by_key_in(const std::vector<Circuit>& cat, const std::string& key);

// Columns: key,pit_stationary_s,pit_lane_delta_s. Optional header row;
// '#' comments and blank lines are ignored; invalid rows are skipped.
std::vector<Circuit> circuit_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Circuit>> load_circuit_catalog_csv(const std::string& path);

} // namespace f1uc
