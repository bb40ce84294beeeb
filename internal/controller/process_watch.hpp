#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/datastore/api/datastore.hpp"
#include "internal/remote/remote_process_client.hpp"

namespace imc::controller {

/*
  Long-lived subscription to one instance manager's process event stream.

  Every received event is merged into the stored instance manager with a
  read-merge-write loop that retries on conflict. Broken streams are reopened
  after reconnect_interval until Stop(). A second thread waits for Stop() and
  closes the stream to unblock a pending open or receive.

  Writes are skipped unless the stored instance manager is RUNNING, and Stop()
  joins the receive thread, so no merge write lands after Stop() returns.
*/
class ProcessWatch {
 public:
  struct Options {
    std::chrono::milliseconds reconnect_interval{1000};
    std::chrono::milliseconds update_retry_interval{1000};
  };

  ProcessWatch(std::string instance_manager, std::unique_ptr<imc::remote::RemoteProcessClient> client, imc::datastore::DataStore& store,
               Options options);
  ~ProcessWatch();

  ProcessWatch(const ProcessWatch&)            = delete;
  ProcessWatch& operator=(const ProcessWatch&) = delete;

  void Start();

  // One-shot. Later calls are logged and ignored.
  void Stop();

  bool Stopped() const;

 private:
  void Run();
  void AwaitShutdown();
  void Join();
  void ApplyEvent(const imc::remote::RemoteProcess& event);

  bool CreateStreamLocked();
  bool OpenStream(imc::remote::ProcessStream* stream);
  void DropStream(const std::string& reason);

  // Sleeps for `interval` unless stopped first. Returns false when stopped.
  bool WaitFor(std::chrono::milliseconds interval);

  const std::string                                  instance_manager_;
  std::unique_ptr<imc::remote::RemoteProcessClient> client_;
  imc::datastore::DataStore&                         store_;
  const Options                                      options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    started_ = false;
  bool                    stopped_ = false;

  // Replaced only by the receive thread; closed under mutex_ by the closer
  // thread, which may happen while the receive thread is still opening it.
  std::unique_ptr<imc::remote::ProcessStream> stream_;

  std::thread receiver_;
  std::thread closer_;
};

} // namespace imc::controller
