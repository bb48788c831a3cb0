#pragma once

#include <atomic>

namespace hotswap {

// Set by SIGINT/SIGTERM. Only honoured by an update before it starts backing up.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace hotswap
