#ifndef INCLUDE_BOXRUNNER_LOGGER_H_
#define INCLUDE_BOXRUNNER_LOGGER_H_

// Keep the console sink lock consistent in children forked by the runtime adapter
void InitLogger();

#endif  // INCLUDE_BOXRUNNER_LOGGER_H_
