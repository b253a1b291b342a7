#ifndef INCLUDE_BOXRUNNER_DISPATCHER_H_
#define INCLUDE_BOXRUNNER_DISPATCHER_H_

#include <atomic>
#include <mutex>
#include <string>
#include <condition_variable>

#include "job.h"
#include "errors.h"
#include "publisher.h"

// maximum number of jobs executing at once; 0 = unlimited
extern int kMaxParallel;

// stage -> write commands -> execute -> read result; the workspace is released on every path.
// cancelled is only checked between these steps.
JobError RunJob(const Job& job, const std::atomic_bool& cancelled, JobResult& result);

struct DispatchStats {
  size_t received;
  size_t malformed; // dropped before dispatch
  size_t dispatched;
  size_t published;
  size_t dropped; // dispatched but no result published

  DispatchStats() : received(0), malformed(0), dispatched(0), published(0), dropped(0) {}
};

class Dispatcher {
  Publisher& publisher_;
  const int max_parallel_;
  std::atomic_bool cancelled_;

  std::mutex mtx_;
  std::condition_variable cv_;
  int in_flight_;
  DispatchStats stats_;

  void RunOne_(Job job);
  void Finish_(bool published);
 public:
  explicit Dispatcher(Publisher& publisher, int max_parallel = kMaxParallel);
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  ~Dispatcher();

  // Called from the single consumption thread, in delivery order.
  // Malformed bodies are logged and dropped (returns false). Otherwise the job
  //   is started on its own thread; this only blocks while max_parallel jobs are running.
  bool Dispatch(const std::string& body);
  void Dispatch(Job&& job);

  void WaitIdle();
  // Ask every running job to stop at its next step boundary
  void CancelAll();
  int InFlight();
  DispatchStats Stats();
};

#endif  // INCLUDE_BOXRUNNER_DISPATCHER_H_
