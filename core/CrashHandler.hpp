#pragma once

// Installs backward-cpp's signal handlers so fatal signals print a symbolized
// stack trace before the process dies. Safe to call more than once.
namespace CrashHandler {

void Init();

} // namespace CrashHandler
