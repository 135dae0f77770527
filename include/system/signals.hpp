#pragma once

#include <atomic>

namespace relay {

// Set by SIGINT/SIGTERM; long-running loops poll it and abort with Cancelled.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

} // namespace relay
