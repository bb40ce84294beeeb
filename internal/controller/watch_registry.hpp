#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/controller/process_watch.hpp"

namespace imc::controller {

/*
  At most one live ProcessWatch per instance manager name.
*/
class WatchRegistry {
 public:
  using WatchFactory = std::function<std::unique_ptr<ProcessWatch>()>;

  ~WatchRegistry();

  // Starts a watch built by `factory` unless one is registered already.
  // Returns true if a new watch was started.
  bool EnsureWatch(const std::string& name, const WatchFactory& factory);

  // Stops, joins and forgets the watch. Returns false if none was registered.
  bool Remove(const std::string& name);

  void StopAll();

  bool        Contains(const std::string& name) const;
  std::size_t Size() const;

 private:
  void PublishSizeLocked() const;

  mutable std::mutex                                   mutex_;
  std::map<std::string, std::unique_ptr<ProcessWatch>> watches_;
};

} // namespace imc::controller
