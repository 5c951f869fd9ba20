#include "util/CommandExecutor.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <initializer_list>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace githooker {

namespace {

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Drains whatever is readable; returns false once the pipe reached EOF
bool drain(int fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

/// Ignores SIGPIPE for the lifetime of the guard (child may close stdin early)
class SigpipeGuard {
public:
    SigpipeGuard() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGPIPE, &ignore, &previous);
    }
    ~SigpipeGuard() { sigaction(SIGPIPE, &previous, nullptr); }
    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    struct sigaction previous {};
};

}

CommandResult CommandExecutor::run(const std::vector<std::string>& argv, const CommandOptions& options) const {
    CommandResult result;
    result.command = argv;
    if (argv.empty()) {
        result.exitCode = 1;
        result.stderrText = "Empty command";
        return result;
    }

    Logger::instance().debug("Executing: " + joinCommand(argv));

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(inPipe) < 0 || pipe(outPipe) < 0 || pipe(errPipe) < 0) {
        for (int* p : {inPipe, outPipe, errPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        result.exitCode = 1;
        result.stderrText = std::string("Failed to create pipe: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    SigpipeGuard sigpipeGuard;
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* p : {inPipe, outPipe, errPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        result.exitCode = 1;
        result.stderrText = std::string("Failed to fork: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(inPipe[0]); close(inPipe[1]);
        close(outPipe[0]); close(outPipe[1]);
        close(errPipe[0]); close(errPipe[1]);

        signal(SIGPIPE, SIG_DFL);
        for (const auto& kv : options.env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            const char msg[] = "Failed to enter working directory\n";
            ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(Constants::EXIT_COMMAND_NOT_FOUND);
        }
        execvp(cargv[0], cargv.data());
        const char prefix[] = "Command not found: ";
        ssize_t ignored = write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        ignored = write(STDERR_FILENO, cargv[0], std::strlen(cargv[0]));
        ignored = write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(Constants::EXIT_COMMAND_NOT_FOUND);
    }

    // Parent process
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    fcntl(inPipe[1], F_SETFL, O_NONBLOCK);
    fcntl(outPipe[0], F_SETFL, O_NONBLOCK);
    fcntl(errPipe[0], F_SETFL, O_NONBLOCK);

    size_t written = 0;
    if (options.input.empty()) closeFd(inPipe[1]);

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        struct pollfd fds[3];
        nfds_t count = 0;
        int outIdx = -1, errIdx = -1, inIdx = -1;
        if (outPipe[0] >= 0) { fds[count] = {outPipe[0], POLLIN, 0}; outIdx = static_cast<int>(count++); }
        if (errPipe[0] >= 0) { fds[count] = {errPipe[0], POLLIN, 0}; errIdx = static_cast<int>(count++); }
        if (inPipe[1] >= 0) { fds[count] = {inPipe[1], POLLOUT, 0}; inIdx = static_cast<int>(count++); }

        if (poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (inIdx >= 0 && fds[inIdx].revents != 0) {
            if (fds[inIdx].revents & POLLOUT) {
                ssize_t n = write(inPipe[1], options.input.data() + written, options.input.size() - written);
                if (n > 0) written += static_cast<size_t>(n);
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || written >= options.input.size()) {
                    closeFd(inPipe[1]);
                }
            } else {
                closeFd(inPipe[1]);
            }
        }
        if (outIdx >= 0 && fds[outIdx].revents != 0 && !drain(outPipe[0], result.stdoutText)) {
            closeFd(outPipe[0]);
        }
        if (errIdx >= 0 && fds[errIdx].revents != 0 && !drain(errPipe[0], result.stderrText)) {
            closeFd(errPipe[0]);
        }
    }
    closeFd(inPipe[1]);
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exitCode = 1;
            result.stderrText += std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = 1;
    }
    result.success = result.exitCode == 0;
    return result;
}

}
