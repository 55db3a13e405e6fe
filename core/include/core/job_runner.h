#pragma once

#include "core/cancel_token.h"
#include "core/job_coordinator.h"
#include "core/logger.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace spine::core {

/// Runner runtime configuration.
struct JobRunnerConfig {
  int max_concurrent_jobs = 5; // worker threads, so also open streams
};

/// Handle to one job started by JobRunner. Copyable; all copies observe the
/// same job.
class JobTicket {
public:
  JobTicket() = default;

  [[nodiscard]] const std::string &job_key() const { return job_key_; }

  /// Request cancellation. A queued job never starts; a running job closes
  /// its connection and leaves the server-side job untouched.
  void cancel();

  /// Block until the job finished (or was canceled) and return its outcome.
  JobOutcome wait() const;

  /// True once wait() would not block.
  [[nodiscard]] bool is_done() const;

private:
  friend class JobRunner;

  std::string job_key_;
  std::shared_ptr<CancelToken> cancel_token_;
  std::shared_future<JobOutcome> outcome_;
};

/// JobRunner: runs independent scan jobs concurrently.
///
/// A fixed pool of `max_concurrent_jobs` workers takes jobs from a FIFO
/// queue, so at most that many coordinators run at once. A job canceled while
/// queued resolves immediately and is skipped when a worker reaches it.
/// Jobs share nothing mutable: every job gets its own coordinator (and so its
/// own event stream and retry state) from the factory.
class JobRunner {
public:
  using CoordinatorFactory =
      std::function<std::unique_ptr<JobLifecycleCoordinator>(
          const std::string &job_key)>;
  using EventCallback = JobLifecycleCoordinator::EventCallback;

  JobRunner(CoordinatorFactory factory, JobRunnerConfig config,
            std::shared_ptr<ILogger> logger);

  /// Drains the queue and joins every worker. Outstanding jobs run to
  /// completion unless canceled.
  ~JobRunner();

  JobRunner(const JobRunner &) = delete;
  JobRunner &operator=(const JobRunner &) = delete;

  /// Queue a job. `on_event` is invoked from the job's worker thread.
  JobTicket start(std::string image_bytes, std::string device_id,
                  EventCallback on_event);

  [[nodiscard]] int running() const;
  [[nodiscard]] size_t queued() const;
  [[nodiscard]] size_t worker_count() const;

private:
  struct Job {
    std::string job_key;
    std::string image_bytes;
    std::string device_id;
    EventCallback on_event;
    std::shared_ptr<CancelToken> cancel_token;
    std::promise<JobOutcome> promise;
    std::atomic<bool> claimed{false}; // worker or queued-cancel, first wins
  };

  CoordinatorFactory factory_;
  JobRunnerConfig config_;
  std::shared_ptr<ILogger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::deque<std::shared_ptr<Job>> pending_;
  int active_ = 0;
  std::vector<std::thread> workers_;

  void worker_loop();
  JobOutcome execute(Job &job);
  void shutdown();
};

} // namespace spine::core
