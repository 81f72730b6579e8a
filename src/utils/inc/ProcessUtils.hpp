#pragma once

#include <map>
#include <optional>
#include <string>
#include <sys/types.h>

namespace ProcessUtils {
    std::map<std::string, std::string> current_environment();

    std::string current_directory();
    std::string home_directory();
    std::string temp_directory();

    // "posix" on every POSIX host, "nt" on Windows
    std::string os_name();

    // Send a signal to a whole process group; false when the group no longer exists
    bool signal_group(pid_t pgid, int signum);

    // Exit code for a waitpid status; a signalled child reports 128 + signal
    int decode_wait_status(int status);

    // Non-blocking reap: the exit code once the child has exited, std::nullopt while it runs
    std::optional<int> try_wait(pid_t pid);

    int wait_blocking(pid_t pid);
}
