#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace Log {

// Console output goes to stderr so tools can keep stdout for their reports.
// `consoleLevel` filters the console only; the file always gets everything.
void Init(const char *fileName = "minisoccer.log",
          spdlog::level::level_enum consoleLevel = spdlog::level::info);
void Shutdown();

// Falls back to spdlog's default logger before Init() and after Shutdown().
spdlog::logger *GetLogger();

} // namespace Log

#define LOG_TRACE(...) ::Log::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::Log::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::Log::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ::Log::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Log::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::Log::GetLogger()->critical(__VA_ARGS__)
