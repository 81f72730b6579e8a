#include "ProcessUtils.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <pwd.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ProcessUtils {

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const char* eq = std::strchr(*entry, '=');
        if (eq == nullptr) continue;
        env.emplace(std::string(*entry, eq - *entry), std::string(eq + 1));
    }
    return env;
}

std::string current_directory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return home;
    }
    if (const passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "/";
}

std::string temp_directory() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::string("/tmp") : tmp.string();
}

std::string os_name() {
#ifdef _WIN32
    return "nt";
#else
    return "posix";
#endif
}

bool signal_group(pid_t pgid, int signum) {
    if (pgid <= 0) return false;
    if (::killpg(pgid, signum) == 0) return true;
    return errno != ESRCH;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::optional<int> try_wait(pid_t pid) {
    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid, &status, WNOHANG);
    } while (w == -1 && errno == EINTR);

    if (w == 0) return std::nullopt;
    if (w == -1) {
        throw std::runtime_error("waitpid failed for pid " + std::to_string(pid) + ": " + std::strerror(errno));
    }
    return decode_wait_status(status);
}

int wait_blocking(pid_t pid) {
    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid, &status, 0);
    } while (w == -1 && errno == EINTR);

    if (w == -1) {
        throw std::runtime_error("waitpid failed for pid " + std::to_string(pid) + ": " + std::strerror(errno));
    }
    return decode_wait_status(status);
}

} // namespace ProcessUtils
