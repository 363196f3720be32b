#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "completion_reconciler.hpp"
#include "session_manager.hpp"

namespace vault::upload {

/*
  Background worker that garbage-collects upload sessions.

  Every interval:
      abort sessions older than session_max_age (memory and persisted rows)
      retry catalog registrations left pending after a store commit
*/
class SessionReaper {
 public:
  SessionReaper(std::shared_ptr<SessionManager> sessions, std::shared_ptr<CompletionReconciler> reconciler,
                std::chrono::milliseconds interval);
  ~SessionReaper();

  void Start();
  void Stop();

  // One sweep on the calling thread.
  void RunOnce();

 private:
  void Run();

  std::shared_ptr<SessionManager>       sessions_;
  std::shared_ptr<CompletionReconciler> reconciler_;
  std::chrono::milliseconds             interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace vault::upload
