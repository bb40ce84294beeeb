#pragma once

#include <map>
#include <memory>
#include <string>

#include "imc/v1.hpp"

namespace imc::remote {

// A process as reported by an instance manager daemon.
struct RemoteProcess {
  imc::v1::InstanceProcess process;
  bool                     deleted = false;
};

using RemoteProcessMap = std::map<std::string, RemoteProcess>;

/*
  Subscription to a daemon's process event stream.
*/
class ProcessStream {
 public:
  virtual ~ProcessStream() = default;

  // Starts the call. Blocks until the daemon answers or the connect attempt
  // fails; returns false on failure. A Close() from another thread cuts it short.
  virtual bool Open() = 0;

  // Blocks for the next event. Returns false once the stream is broken or closed.
  virtual bool Recv(RemoteProcess* out) = 0;

  // Unblocks a pending Recv() from another thread. Safe to call repeatedly.
  virtual void Close() = 0;

  // Why the stream ended; only meaningful after Open() or Recv() returned false.
  virtual std::string Finish() = 0;
};

/*
  Role interface for the two daemon flavors (engine manager, replica manager).
  Both list and stream the same common record.

  List() and Watch() throw util::Unavailable when the daemon cannot be reached.
*/
class RemoteProcessClient {
 public:
  virtual ~RemoteProcessClient() = default;

  virtual const char* Role() const = 0;

  virtual RemoteProcessMap List() = 0;

  // Returns an unopened stream without touching the network.
  virtual std::unique_ptr<ProcessStream> Watch() = 0;
};

class RemoteClientFactory {
 public:
  virtual ~RemoteClientFactory() = default;

  // Throws util::InvalidState for an unspecified manager type.
  virtual std::unique_ptr<RemoteProcessClient> Create(imc::v1::InstanceManagerType type, const std::string& ip) = 0;
};

} // namespace imc::remote
