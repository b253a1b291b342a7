#ifndef INCLUDE_BOXRUNNER_PUBLISHER_H_
#define INCLUDE_BOXRUNNER_PUBLISHER_H_

class JobResult;

class Publisher {
 public:
  virtual ~Publisher() {}
  // Called concurrently from job threads. Return true only after the outbound
  //   channel acknowledged the result; a false return means the result is lost.
  virtual bool Publish(const JobResult&) = 0;
};

#endif  // INCLUDE_BOXRUNNER_PUBLISHER_H_
