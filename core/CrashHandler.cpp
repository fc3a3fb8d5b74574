#include "CrashHandler.hpp"
#include <backward.hpp>

#include "core/Log.hpp"

namespace CrashHandler {

// Lives for the whole process; the handlers must outlast every other object.
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (s_SignalHandler) {
    return;
  }
  s_SignalHandler = new backward::SignalHandling();
  if (!s_SignalHandler->loaded()) {
    LOG_WARN("Crash handler could not install signal handlers");
  }
}

} // namespace CrashHandler
