#pragma once

#include <atomic>

namespace cloner {

// Set by SIGINT/SIGTERM. Blocking reads and copy loops poll it.
extern std::atomic_bool g_cancel;

// Installs handlers without SA_RESTART so a read blocked on the channel
// returns EINTR and can observe g_cancel.
void InstallSignalHandlers();

} // namespace cloner
