#ifndef INCLUDE_BOXRUNNER_ERRORS_H_
#define INCLUDE_BOXRUNNER_ERRORS_H_

// Failures above the command outcome level; any of these drops the job
#define ENUM_JOB_ERROR_ \
  X(OK) \
  X(TEMPLATE_MISSING) /* baseline template directory is absent */ \
  X(WORKSPACE_ERROR) /* I/O failure creating, copying or writing the workspace */ \
  X(RUNTIME_INVOCATION_ERROR) /* isolation runtime could not be launched */ \
  X(RESULT_MISSING) \
  X(RESULT_MALFORMED) \
  X(RESULT_MISMATCH) /* result count differs from command count */ \
  X(CANCELLED)
enum class JobError {
#define X(name) name,
  ENUM_JOB_ERROR_
#undef X
};

const char* JobErrorName(JobError);

#endif  // INCLUDE_BOXRUNNER_ERRORS_H_
