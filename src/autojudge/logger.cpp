#include <autojudge/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

namespace {

using ConsoleSink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

// sandbox-exec is forked while other threads may be logging; a console mutex
//   held at fork time would never be released in the child
template <class Fn>
void ForEachConsoleMutex(Fn&& fn) {
  for (auto& sink : spdlog::default_logger()->sinks()) {
    if (auto console = dynamic_cast<ConsoleSink*>(sink.get())) fn(console->mutex_);
  }
}

void BeforeFork() {
  ForEachConsoleMutex([](auto& mutex) { mutex.lock(); });
}

void AfterFork() {
  ForEachConsoleMutex([](auto& mutex) { mutex.unlock(); });
}

} // namespace

void InitLogger() {
  spdlog::debug("Registering fork handlers for console sinks");
  pthread_atfork(BeforeFork, AfterFork, AfterFork);
}
