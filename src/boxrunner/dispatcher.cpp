#include <boxrunner/dispatcher.h>

#include <thread>
#include <exception>
#include <system_error>

#include <spdlog/spdlog.h>

#include <boxrunner/runtime.h>
#include <boxrunner/workspace.h>

int kMaxParallel = 0;

JobError RunJob(const Job& job, const std::atomic_bool& cancelled, JobResult& result) {
  if (cancelled) return JobError::CANCELLED;
  ScopedWorkspace scoped;
  Workspace& ws = scoped.Get();
  if (JobError err = StageWorkspace(job.submit_id, ws); err != JobError::OK) return err;
  if (JobError err = WriteCommands(ws, job.commands); err != JobError::OK) return err;
  if (cancelled) return JobError::CANCELLED;
  if (JobError err = ExecuteIsolation(ws, job.profile); err != JobError::OK) return err;
  if (cancelled) return JobError::CANCELLED;
  std::vector<CommandResult> results;
  if (JobError err = ReadResult(ws, job.commands.size(), results); err != JobError::OK) return err;
  result.results = std::move(results);
  result.submit_id = job.submit_id;
  return JobError::OK;
}

Dispatcher::Dispatcher(Publisher& publisher, int max_parallel) :
    publisher_(publisher), max_parallel_(max_parallel), cancelled_(false), in_flight_(0) {}

Dispatcher::~Dispatcher() {
  // job threads are detached and refer to this object
  WaitIdle();
}

bool Dispatcher::Dispatch(const std::string& body) {
  {
    std::lock_guard lck(mtx_);
    stats_.received++;
  }
  Job job;
  if (!ParseJob(body, job)) {
    std::lock_guard lck(mtx_);
    stats_.malformed++;
    spdlog::warn("Dropped malformed message ({} bytes)", body.size());
    return false;
  }
  Dispatch(std::move(job));
  return true;
}

void Dispatcher::Dispatch(Job&& job) {
  {
    std::unique_lock lck(mtx_);
    // saturation delays consumption instead of dropping; the stream keeps the message
    if (max_parallel_ > 0 && in_flight_ >= max_parallel_) {
      spdlog::info("All {} job slots busy; waiting before dispatching job {}", max_parallel_, job.submit_id);
      cv_.wait(lck, [this]{ return in_flight_ < max_parallel_; });
    }
    in_flight_++;
    stats_.dispatched++;
  }
  spdlog::info("Job dispatched: submit_id={} profile={} commands={}",
               job.submit_id, job.profile, job.commands.size());
  try {
    std::thread(&Dispatcher::RunOne_, this, std::move(job)).detach();
  } catch (std::system_error& err) {
    spdlog::error("Job dropped: failed starting job thread: {}", err.what());
    Finish_(false);
  }
}

void Dispatcher::RunOne_(Job job) {
  bool published = false;
  // this is the top of a detached thread; an escaping exception would terminate the runner
  try {
    JobResult result;
    JobError err = RunJob(job, cancelled_, result);
    if (err != JobError::OK) {
      spdlog::error("Job dropped: submit_id={} error={}", job.submit_id, JobErrorName(err));
    } else if ((published = publisher_.Publish(result))) {
      spdlog::info("Job finished: submit_id={}", job.submit_id);
    } else {
      spdlog::error("Job dropped: submit_id={} error=PUBLISH_FAILED", job.submit_id);
    }
  } catch (std::exception& err) {
    spdlog::error("Job dropped: submit_id={} error=EXCEPTION {}", job.submit_id, err.what());
    published = false;
  }
  Finish_(published);
}

void Dispatcher::Finish_(bool published) {
  {
    std::lock_guard lck(mtx_);
    in_flight_--;
    if (published) {
      stats_.published++;
    } else {
      stats_.dropped++;
    }
    // notify under the lock: once WaitIdle returns, the dispatcher may be destroyed
    cv_.notify_all();
  }
}

void Dispatcher::WaitIdle() {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]{ return in_flight_ == 0; });
}

void Dispatcher::CancelAll() {
  cancelled_ = true;
}

int Dispatcher::InFlight() {
  std::lock_guard lck(mtx_);
  return in_flight_;
}

DispatchStats Dispatcher::Stats() {
  std::lock_guard lck(mtx_);
  return stats_;
}
