#include <scriptbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// the console sinks all serialize on this one mutex
std::mutex& ConsoleMutex() {
  return spdlog::details::console_mutex::mutex();
}

void Prepare() {
  ConsoleMutex().lock();
}

void Child() {
  ConsoleMutex().unlock();
}

void Parent() {
  ConsoleMutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
