#include "process_runner.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <format>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
extern volatile std::sig_atomic_t gShutdownFlag;

namespace {

constexpr std::size_t kMaxErrorOutput = 16 * 1024;
constexpr auto kPollInterval = std::chrono::milliseconds(200);
constexpr auto kReapInterval = std::chrono::milliseconds(20);

// Returns false once the pipe reached end of file or failed.
bool readErrorOutput(int fd, std::string& output) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        if (output.size() < kMaxErrorOutput) {
            output.append(buf, std::min(static_cast<std::size_t>(n), kMaxErrorOutput - output.size()));
        }
        return true;
    }
    return n < 0 && errno == EINTR;
}

std::vector<char*> toCStrings(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

std::string variableName(const std::string& entry) {
    return entry.substr(0, entry.find('='));
}

std::vector<std::string> childEnvironment(const std::vector<std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto name = variableName(entry);
        bool overridden = std::ranges::any_of(extra, [&name](const std::string& x) {
            return variableName(x) == name;
        });
        if (!overridden) {
            env.push_back(std::move(entry));
        }
    }
    env.insert(env.end(), extra.begin(), extra.end());
    return env;
}

bool isExecutableFile(const fs::path& candidate) {
    std::error_code ec;
    return fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0;
}

} // namespace

std::expected<ProcessResult, std::string> runProcess(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        return std::unexpected("Empty command");
    }

    int outFd = -1;
    if (spec.stdoutFile) {
        outFd = open(spec.stdoutFile->c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (outFd < 0) {
            return std::unexpected(std::format("Failed to create output file: {} (error: {})",
                                               spec.stdoutFile->string(), strerror(errno)));
        }
    }

    int errPipe[2];
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        int err = errno;
        if (outFd >= 0) {
            close(outFd);
            unlink(spec.stdoutFile->c_str());
        }
        return std::unexpected(std::format("Failed to create pipe (error: {})", strerror(err)));
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> args = spec.argv;
    std::vector<std::string> env = childEnvironment(spec.extraEnv);
    ScopedSecretWipe envWipe(env);
    auto argvPtrs = toCStrings(args);
    auto envPtrs = toCStrings(env);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(errPipe[0]);
        close(errPipe[1]);
        if (outFd >= 0) {
            close(outFd);
            unlink(spec.stdoutFile->c_str());
        }
        return std::unexpected(std::format("Failed to fork for {} (error: {})", spec.argv.front(), strerror(err)));
    }

    if (pid == 0) {
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        if (outFd >= 0) {
            dup2(outFd, STDOUT_FILENO);
        }
        dup2(errPipe[1], STDERR_FILENO);
        execvpe(argvPtrs[0], argvPtrs.data(), envPtrs.data());
        _exit(127);
    }

    close(errPipe[1]);
    if (outFd >= 0) {
        close(outFd);
    }

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    bool pipeOpen = true;
    bool exited = false;
    int status = 0;

    // Stops on the child's own exit: background descendants may keep stderr open.
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            int err = errno;
            close(errPipe[0]);
            return std::unexpected(std::format("Failed to wait for {} (error: {})", spec.argv.front(), strerror(err)));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 || gShutdownFlag) {
            result.timedOut = remaining.count() <= 0;
            kill(pid, SIGKILL);
            break;
        }

        if (!pipeOpen) {
            std::this_thread::sleep_for(std::min(remaining, kReapInterval));
            continue;
        }
        pollfd pfd{errPipe[0], POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(std::min(remaining, kPollInterval).count()));
        if (rc > 0) {
            pipeOpen = readErrorOutput(errPipe[0], result.errorOutput);
        } else if (rc < 0 && errno != EINTR) {
            pipeOpen = false;
        }
    }

    if (exited) {
        // Only what is already buffered; a descendant holding the write end must not block us.
        while (pipeOpen) {
            pollfd pfd{errPipe[0], POLLIN, 0};
            if (poll(&pfd, 1, 0) <= 0) {
                break;
            }
            pipeOpen = readErrorOutput(errPipe[0], result.errorOutput);
        }
    }
    close(errPipe[0]);

    while (!exited) {
        pid_t waited = waitpid(pid, &status, 0);
        if (waited == pid) {
            exited = true;
        } else if (waited < 0 && errno != EINTR) {
            return std::unexpected(std::format("Failed to wait for {} (error: {})", spec.argv.front(), strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
    }
    return result;
}

void wipeSecret(std::string& secret) noexcept {
    volatile char* p = secret.data();
    for (std::size_t i = 0; i < secret.size(); ++i) {
        p[i] = '\0';
    }
    secret.clear();
}

ScopedSecretWipe::~ScopedSecretWipe() {
    if (single_) {
        wipeSecret(*single_);
    }
    if (many_) {
        for (auto& s : *many_) {
            wipeSecret(s);
        }
    }
}

std::optional<fs::path> findExecutable(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        if (isExecutableFile(program)) {
            return fs::path(program);
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::istringstream dirs(pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / program;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}
