#include "core/job_runner.h"

#include "core/ids.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

namespace spine::core {

namespace {

constexpr const char *kComponent = "runner";

JobOutcome canceled_before_start(const std::string &job_key) {
  JobOutcome outcome;
  outcome.job_key = job_key;
  outcome.state = JobState::Created;
  outcome.canceled_by_caller = true;
  outcome.error = ClientError::Canceled("Canceled while waiting for a slot");
  return outcome;
}

} // namespace

// ---- JobTicket ----

void JobTicket::cancel() {
  if (cancel_token_) {
    cancel_token_->request_cancel();
  }
}

JobOutcome JobTicket::wait() const {
  if (!outcome_.valid()) {
    JobOutcome outcome;
    outcome.job_key = job_key_;
    outcome.error = ClientError::Internal("Ticket is not bound to a job");
    return outcome;
  }
  return outcome_.get();
}

bool JobTicket::is_done() const {
  return outcome_.valid() &&
         outcome_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// ---- JobRunner ----

JobRunner::JobRunner(CoordinatorFactory factory, JobRunnerConfig config,
                     std::shared_ptr<ILogger> logger)
    : factory_(std::move(factory)), config_(config), logger_(std::move(logger)) {
  if (config_.max_concurrent_jobs <= 0) {
    config_.max_concurrent_jobs = 1;
  }
  workers_.reserve(static_cast<size_t>(config_.max_concurrent_jobs));
  try {
    for (int i = 0; i < config_.max_concurrent_jobs; ++i) {
      workers_.emplace_back([this]() { worker_loop(); });
    }
  } catch (const std::system_error &) {
    shutdown();
    throw;
  }
}

JobRunner::~JobRunner() { shutdown(); }

void JobRunner::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
}

JobTicket JobRunner::start(std::string image_bytes, std::string device_id,
                           EventCallback on_event) {
  auto job = std::make_shared<Job>();
  job->job_key = generate_id("scan");
  job->image_bytes = std::move(image_bytes);
  job->device_id = std::move(device_id);
  job->on_event = std::move(on_event);
  job->cancel_token = CancelToken::create();

  JobTicket ticket;
  ticket.job_key_ = job->job_key;
  ticket.cancel_token_ = job->cancel_token;
  ticket.outcome_ = job->promise.get_future().share();

  // Resolve a still-queued job as soon as its ticket is canceled. The token
  // may outlive the runner, so the callback holds the job weakly.
  std::weak_ptr<Job> weak_job = job;
  auto logger = logger_;
  job->cancel_token->on_cancel([weak_job, logger]() {
    auto queued_job = weak_job.lock();
    if (!queued_job || queued_job->claimed.exchange(true)) {
      return;
    }
    if (logger) {
      logger->info(queued_job->job_key, kComponent, "job_dropped",
                   "canceled before a slot was free");
    }
    queued_job->promise.set_value(canceled_before_start(queued_job->job_key));
  });

  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(job);
    if (logger_) {
      logger_->debug(job->job_key, kComponent, "job_queued",
                     "position=" + std::to_string(pending_.size()));
    }
  }
  cv_.notify_one();
  return ticket;
}

int JobRunner::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

size_t JobRunner::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(pending_.begin(), pending_.end(),
                    [](const std::shared_ptr<Job> &job) {
                      return !job->claimed.load();
                    }));
}

size_t JobRunner::worker_count() const { return workers_.size(); }

void JobRunner::worker_loop() {
  while (true) {
    std::shared_ptr<Job> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      job = std::move(pending_.front());
      pending_.pop_front();
      if (job->claimed.exchange(true)) {
        continue; // already resolved by its cancel callback
      }
      ++active_;
    }

    auto outcome = execute(*job);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
    }
    if (logger_) {
      logger_->debug(job->job_key, kComponent, "job_released",
                     std::string("state=") + to_string(outcome.state));
    }
    job->promise.set_value(std::move(outcome));
  }
}

JobOutcome JobRunner::execute(Job &job) {
  JobOutcome outcome;
  outcome.job_key = job.job_key;
  try {
    auto coordinator = factory_ ? factory_(job.job_key) : nullptr;
    if (!coordinator) {
      outcome.error = ClientError::Internal("Coordinator factory returned null");
      return outcome;
    }
    return coordinator->run(job.image_bytes, job.device_id, job.on_event,
                            job.cancel_token);
  } catch (const std::exception &e) {
    if (logger_) {
      logger_->error(job.job_key, kComponent, "job_aborted", e.what());
    }
    outcome.state = JobState::Failed;
    outcome.error = ClientError::Internal(std::string("Job aborted: ") + e.what());
    return outcome;
  }
}

} // namespace spine::core
