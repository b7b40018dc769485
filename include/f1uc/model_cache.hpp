#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <f1uc/compound.hpp>
#include <f1uc/model_fitter.hpp>
#include <f1uc/observation.hpp>

namespace f1uc {

struct ModelKey {
  Family family = Family::Degradation;
  std::string circuit;
  int season = 0;
  Compound compound = Compound::Medium;

  bool operator<(const ModelKey& o) const {
    return std::tie(family, circuit, season, compound) <
           std::tie(o.family, o.circuit, o.season, o.compound);
  }
};

// Fitted models keyed by (family, context). Each entry remembers the provider
// revision it was fitted against; a lookup under a different revision misses
// and drops the entry. Safe for concurrent use.
class ModelCache {
public:
  std::optional<FittedModel> find(const ModelKey& key, std::uint64_t revision);
  void store(const ModelKey& key, std::uint64_t revision, const FittedModel& model);

  // Drops every entry, e.g. after swapping providers.
  void invalidate();

  std::size_t size() const;
  std::uint64_t hits() const { return hits_.load(std::memory_order_relaxed); }
  std::uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }

private:
  struct Entry {
    std::uint64_t revision = 0;
    FittedModel model;
  };

  mutable std::mutex mu_;
  std::map<ModelKey, Entry> entries_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
};

} // namespace f1uc
