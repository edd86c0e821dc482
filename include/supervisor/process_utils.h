// include/supervisor/process_utils.h
#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

namespace kiosk_payment::supervisor {

// Processes whose executable name matches `processName` (argv[0] basename,
// or the kernel's 15-character comm for long names). The calling process is
// never included.
std::vector<pid_t> findProcessesByName(const std::string& processName);

bool isProcessAlive(pid_t pid);

// Sends SIGKILL and blocks until the process is gone (reaped, or a zombie of
// another parent). No timeout. False only when the signal cannot be sent.
bool killAndWait(pid_t pid, std::string& error);

} // namespace kiosk_payment::supervisor
