#include <f1uc/data_provider.hpp>
#include <mutex>

namespace f1uc {

bool matches(const DataQuery& q, const Observation& o) {
  if (o.family != q.family) return false;
  if (q.circuit && circuit_key(*q.circuit) != o.circuit) return false;
  if (q.season && *q.season != o.season) return false;
  if (q.compound && *q.compound != o.compound) return false;
  return true;
}

InMemoryDataProvider::InMemoryDataProvider(std::vector<Observation> obs) {
  add_all(obs);
}

void InMemoryDataProvider::add(const Observation& o) {
  std::unique_lock lock(mu_);
  obs_.push_back(o);
  obs_.back().circuit = circuit_key(o.circuit);
  ++revision_;
}

void InMemoryDataProvider::add_all(const std::vector<Observation>& obs) {
  std::unique_lock lock(mu_);
  obs_.reserve(obs_.size() + obs.size());
  for (const auto& o : obs) {
    obs_.push_back(o);
    obs_.back().circuit = circuit_key(o.circuit);
  }
  ++revision_;
}

void InMemoryDataProvider::clear() {
  std::unique_lock lock(mu_);
  obs_.clear();
  ++revision_;
}

std::size_t InMemoryDataProvider::size() const {
  std::shared_lock lock(mu_);
  return obs_.size();
}

std::vector<Observation> InMemoryDataProvider::query(const DataQuery& q) const {
  std::shared_lock lock(mu_);
  std::vector<Observation> out;
  for (const auto& o : obs_) {
    if (matches(q, o)) out.push_back(o);
  }
  return out;
}

std::uint64_t InMemoryDataProvider::revision() const {
  std::shared_lock lock(mu_);
  return revision_;
}

} // namespace f1uc
