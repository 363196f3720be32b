#include "session_reaper.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vault::upload {

using observability::StringField;
using observability::UIntField;

SessionReaper::SessionReaper(std::shared_ptr<SessionManager> sessions, std::shared_ptr<CompletionReconciler> reconciler,
                             std::chrono::milliseconds interval)
    : sessions_(std::move(sessions)), reconciler_(std::move(reconciler)), interval_(interval) {
}

SessionReaper::~SessionReaper() {
  Stop();
}

void SessionReaper::Start() {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("SessionReaper: interval must be positive");
  }
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SessionReaper::Run, this);
}

void SessionReaper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SessionReaper::RunOnce() {
  try {
    const auto reaped = sessions_->ReapExpired();
    if (reaped > 0) {
      VAULT_LOG_INFO("reaper aborted expired sessions", {UIntField("count", reaped)});
    }
  } catch (const std::exception& e) {
    VAULT_LOG_ERROR("session reap failed", {StringField("error", e.what())});
  }

  try {
    if (reconciler_->PendingCount() > 0) {
      const auto registered = reconciler_->RetryPendingRegistrations();
      VAULT_LOG_INFO("reaper retried pending registrations",
                     {UIntField("registered", registered), UIntField("still_pending", reconciler_->PendingCount())});
    }
  } catch (const std::exception& e) {
    VAULT_LOG_ERROR("pending registration retry failed", {StringField("error", e.what())});
  }
}

void SessionReaper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, interval_, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

} // namespace vault::upload
