#ifndef INCLUDE_SCRIPTBOX_LOGGER_H_
#define INCLUDE_SCRIPTBOX_LOGGER_H_

// Must be called before any thread forks a sandboxed child, so that the console
//   sink mutexes are never inherited in a locked state
void InitLogger();

#endif  // INCLUDE_SCRIPTBOX_LOGGER_H_
