#include "datapilot/logging.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace datapilot {

std::shared_ptr<spdlog::logger> logger() {
  static std::mutex mutex;
  std::lock_guard<std::mutex> lock(mutex);

  // Resolved on each call; a host application may have called spdlog::drop_all()
  auto log = spdlog::get(LOGGER_NAME);
  if (!log) {
    log = spdlog::stderr_color_mt(LOGGER_NAME);
    log->set_level(spdlog::level::warn);
    log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  }
  return log;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

} // namespace datapilot
