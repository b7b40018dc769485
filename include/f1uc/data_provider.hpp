#pragma once
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <f1uc/compound.hpp>
#include <f1uc/observation.hpp>

namespace f1uc {

// Context filter for one backoff rung. An empty field matches anything.
struct DataQuery {
  Family family = Family::Degradation;
  std::optional<std::string> circuit;
  std::optional<int> season;
  std::optional<Compound> compound;
};

bool matches(const DataQuery& q, const Observation& o);

// Read-only source of historical observations. Implementations must allow
// concurrent calls to query() and revision().
class HistoricalDataProvider {
public:
  virtual ~HistoricalDataProvider() = default;

  // May throw; the fitter surfaces any failure as UpstreamDataError.
  virtual std::vector<Observation> query(const DataQuery& q) const = 0;

  // Changes whenever the dataset changes; cached models are keyed on it.
  virtual std::uint64_t revision() const = 0;
};

class InMemoryDataProvider : public HistoricalDataProvider {
public:
  InMemoryDataProvider() = default;
  explicit InMemoryDataProvider(std::vector<Observation> obs);

  void add(const Observation& o);
  void add_all(const std::vector<Observation>& obs);
  void clear();
  std::size_t size() const;

  std::vector<Observation> query(const DataQuery& q) const override;
  std::uint64_t revision() const override;

private:
  mutable std::shared_mutex mu_;
  std::vector<Observation> obs_;
  std::uint64_t revision_ = 0;
};

} // namespace f1uc
