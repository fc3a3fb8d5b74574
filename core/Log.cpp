#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;

void Init(const char *fileName, const spdlog::level::level_enum consoleLevel) {
  if (s_Logger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;

  auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  consoleSink->set_level(consoleLevel);
  sinks.push_back(consoleSink);

  if (fileName != nullptr && fileName[0] != '\0') {
    auto fileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(fileName, true);
    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
    sinks.push_back(fileSink);
  }

  s_Logger = std::make_shared<spdlog::logger>("MINISOCCER", sinks.begin(),
                                              sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(spdlog::level::trace);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_DEBUG("Logging to {}", (fileName != nullptr) ? fileName : "console");
}

void Shutdown() {
  if (!s_Logger) {
    return;
  }
  s_Logger->flush();
  spdlog::drop(s_Logger->name());
  s_Logger.reset();
}

spdlog::logger *GetLogger() {
  return s_Logger ? s_Logger.get() : spdlog::default_logger_raw();
}

} // namespace Log
