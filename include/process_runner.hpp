/**
 * @file process_runner.hpp
 * @brief Runs external programs with a bounded execution time.
 *
 * Programs are started directly from an argument vector (no shell), so arguments
 * never need quoting. Standard output can be redirected into a newly created file,
 * standard error is captured, and extra environment entries are only visible to
 * the child process.
 *
 * @note POSIX only (fork/execvpe/waitpid).
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Description of one external invocation.
 */
struct ProcessSpec {
    std::vector<std::string> argv;             ///< Program followed by its arguments.
    std::vector<std::string> extraEnv;         ///< "NAME=value" entries added to the child environment.
    std::optional<fs::path> stdoutFile;        ///< Created exclusively; the call fails if it exists.
    std::chrono::seconds timeout{600};         ///< Child is killed when exceeded.
};

/**
 * @brief How the child process ended.
 */
struct ProcessResult {
    int exitCode = -1;          ///< Exit status when the child exited normally.
    bool signaled = false;      ///< Child was terminated by a signal.
    bool timedOut = false;      ///< Child was killed because the timeout elapsed.
    std::string errorOutput;    ///< Captured standard error (truncated).

    bool succeeded() const { return !signaled && !timedOut && exitCode == 0; }
};

/**
 * @brief Starts a process and waits for it, honouring the timeout.
 *
 * @param spec Invocation description.
 * @return std::expected<ProcessResult, std::string> How the child ended, or an error
 *         when it could not be started at all (fork failure, output file not creatable).
 * @note A program that cannot be executed is reported as exit code 127, as a shell would.
 *       The call returns once the child itself has exited, even if a background
 *       descendant still holds its standard error open.
 */
std::expected<ProcessResult, std::string> runProcess(const ProcessSpec& spec);

/**
 * @brief Overwrites a secret in place and empties it.
 */
void wipeSecret(std::string& secret) noexcept;

/**
 * @brief Wipes the referenced secrets when the scope ends, including on unwinding.
 */
class ScopedSecretWipe {
public:
    explicit ScopedSecretWipe(std::string& secret) : single_(&secret) {}
    explicit ScopedSecretWipe(std::vector<std::string>& secrets) : many_(&secrets) {}
    ~ScopedSecretWipe();

    ScopedSecretWipe(const ScopedSecretWipe&) = delete;
    ScopedSecretWipe& operator=(const ScopedSecretWipe&) = delete;

private:
    std::string* single_ = nullptr;
    std::vector<std::string>* many_ = nullptr;
};

/**
 * @brief Locates an executable.
 *
 * Names containing a slash are checked directly, other names are searched in PATH.
 *
 * @param program Program name or path.
 * @return std::optional<fs::path> Resolved path, or std::nullopt if not found.
 */
std::optional<fs::path> findExecutable(const std::string& program);

#endif // PROCESS_RUNNER_HPP
