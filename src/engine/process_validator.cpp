#include "engine/process_validator.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace redactor {
namespace engine {

bool ProcessValidator::validate(const std::string& candidate) {
    pid_t pid = spawn(candidate);

    int status = 0;
    if (!waitWithTimeout(pid, status)) {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        util::logger::warn("ProcessValidator: " + m_executable + " timed out after " +
                           std::to_string(m_timeout.count()) + " ms, candidate rejected");
        return false;
    }

    if (WIFEXITED(status))
        return WEXITSTATUS(status) == 0;
    if (WIFSIGNALED(status)) {
        throw ValidatorInvocationError(ValidatorInvocationError::Kind::Crashed,
                                       "ProcessValidator: " + m_executable + " killed by signal " +
                                           std::to_string(WTERMSIG(status)));
    }
    return false;
}

pid_t ProcessValidator::spawn(const std::string& candidate) {
    // argv is built before fork; the child only makes async-signal-safe calls
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(m_executable.c_str()));
    argv.push_back(const_cast<char*>(candidate.c_str()));
    argv.push_back(nullptr);

    int errPipe[2];
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        throw ValidatorInvocationError(ValidatorInvocationError::Kind::LaunchFailed,
                                       std::string("ProcessValidator: pipe failed: ") +
                                           std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(errPipe[0]);
        close(errPipe[1]);
        throw ValidatorInvocationError(ValidatorInvocationError::Kind::LaunchFailed,
                                       std::string("ProcessValidator: fork failed: ") +
                                           std::strerror(err));
    }

    if (pid == 0) {
        close(errPipe[0]);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            if (devnull > STDERR_FILENO)
                close(devnull);
        }
        execv(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(errPipe[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw ValidatorInvocationError(ValidatorInvocationError::Kind::LaunchFailed,
                                       "ProcessValidator: cannot execute " + m_executable + ": " +
                                           std::strerror(childErr));
    }
    return pid;
}

void ProcessValidator::throwLostChild() const {
    throw ValidatorInvocationError(ValidatorInvocationError::Kind::Crashed,
                                   "ProcessValidator: lost track of " + m_executable + ": " +
                                       std::strerror(errno));
}

bool ProcessValidator::waitWithTimeout(pid_t pid, int& status) {
    if (m_timeout.count() <= 0) {
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR)
                throwLostChild();
        }
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() + m_timeout;
    auto pause = std::chrono::milliseconds(1);
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid)
            return true;
        if (r < 0 && errno != EINTR)
            throwLostChild();
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(pause, left));
        pause = std::min(pause * 2, std::chrono::milliseconds(50));
    }
}

} // namespace engine
} // namespace redactor
