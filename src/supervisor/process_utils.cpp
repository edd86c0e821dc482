// src/supervisor/process_utils.cpp
#include "supervisor/process_utils.h"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace kiosk_payment::supervisor {

namespace {

constexpr size_t COMM_LENGTH = 15;

bool isNumeric(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string readFirstLine(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::string line;
    std::getline(file, line);
    return line;
}

// argv[0] up to the first NUL
std::string readArgv0(const std::filesystem::path& procDir) {
    std::ifstream file(procDir / "cmdline", std::ios::binary);
    std::string argv0;
    std::getline(file, argv0, '\0');
    return argv0;
}

// Field 3 of /proc/<pid>/stat; the comm in field 2 may contain spaces
char readState(pid_t pid) {
    std::string stat = readFirstLine("/proc/" + std::to_string(pid) + "/stat");
    auto close = stat.rfind(')');
    if (close == std::string::npos || close + 2 >= stat.size()) {
        return '\0';
    }
    return stat[close + 2];
}

bool matches(const std::filesystem::path& procDir, const std::string& processName) {
    const std::string argv0 = readArgv0(procDir);
    if (!argv0.empty() && std::filesystem::path(argv0).filename().string() == processName) {
        return true;
    }
    const std::string comm = readFirstLine(procDir / "comm");
    return !comm.empty() && comm == processName.substr(0, COMM_LENGTH);
}

} // namespace

std::vector<pid_t> findProcessesByName(const std::string& processName) {
    std::vector<pid_t> pids;
    if (processName.empty()) {
        return pids;
    }

    const pid_t self = ::getpid();
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (!isNumeric(name)) {
            continue;
        }
        const pid_t pid = static_cast<pid_t>(std::stol(name));
        if (pid == self) {
            continue;
        }
        // Processes may exit while we scan; unreadable entries simply do not match
        if (matches(entry.path(), processName) && readState(pid) != 'Z') {
            pids.push_back(pid);
        }
    }
    return pids;
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) != 0 && errno == ESRCH) {
        return false;
    }
    const char state = readState(pid);
    return state != '\0' && state != 'Z' && state != 'X';
}

bool killAndWait(pid_t pid, std::string& error) {
    if (::kill(pid, SIGKILL) != 0) {
        if (errno == ESRCH) {
            return true;
        }
        error = "kill(" + std::to_string(pid) + "): " + std::strerror(errno);
        return false;
    }

    for (;;) {
        // Reap it when it is our child; ECHILD means someone else's
        int status = 0;
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            return true;
        }
        if (!isProcessAlive(pid)) {
            // A child may have turned zombie between the two checks
            (void)::waitpid(pid, &status, WNOHANG);
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace kiosk_payment::supervisor
