#include <f1uc/model_cache.hpp>

namespace f1uc {

std::optional<FittedModel> ModelCache::find(const ModelKey& key, std::uint64_t revision) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  if (it->second.revision != revision) {
    entries_.erase(it); // stale: dataset changed since the fit
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  hits_.fetch_add(1, std::memory_order_relaxed);
  return it->second.model;
}

void ModelCache::store(const ModelKey& key, std::uint64_t revision, const FittedModel& model) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_[key] = Entry{revision, model};
}

void ModelCache::invalidate() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

std::size_t ModelCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

} // namespace f1uc
