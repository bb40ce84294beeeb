#include "internal/controller/watch_registry.hpp"

#include <vector>

#include "internal/observability/spans.hpp"

namespace imc::controller {

WatchRegistry::~WatchRegistry() {
  StopAll();
}

bool WatchRegistry::EnsureWatch(const std::string& name, const WatchFactory& factory) {
  std::lock_guard lock(mutex_);
  if (watches_.count(name)) return false;

  auto watch = factory();
  watch->Start();
  watches_.emplace(name, std::move(watch));
  PublishSizeLocked();
  return true;
}

bool WatchRegistry::Remove(const std::string& name) {
  std::unique_ptr<ProcessWatch> watch;
  {
    std::lock_guard lock(mutex_);
    auto it = watches_.find(name);
    if (it == watches_.end()) return false;
    watch = std::move(it->second);
    watches_.erase(it);
    PublishSizeLocked();
  }

  // Joined outside the lock: the receive thread may be mid-write.
  watch->Stop();
  return true;
}

void WatchRegistry::StopAll() {
  std::vector<std::unique_ptr<ProcessWatch>> stopping;
  {
    std::lock_guard lock(mutex_);
    for (auto& [_, watch] : watches_) {
      stopping.push_back(std::move(watch));
    }
    watches_.clear();
    PublishSizeLocked();
  }

  for (auto& watch : stopping) {
    watch->Stop();
  }
}

bool WatchRegistry::Contains(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return watches_.count(name) > 0;
}

std::size_t WatchRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return watches_.size();
}

void WatchRegistry::PublishSizeLocked() const {
  imc::observability::Metrics::Instance().SetActiveWatches(watches_.size());
}

} // namespace imc::controller
