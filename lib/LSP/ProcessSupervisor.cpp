//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements POSIX spawning and supervision of language-server processes.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/ProcessSupervisor.h"

#include "lspbridge/LSP/ClientError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace lspbridge::lsp
{
namespace
{

constexpr llvm::StringLiteral Component       = "supervisor";
constexpr llvm::StringLiteral StderrComponent = "server-stderr";

/// Failure stages reported by the child through the exec status pipe.
enum class ChildStage : int
{
    ChangeDirectory = 1,
    Exec            = 2,
};

/// Pipe whose ends are closed on destruction unless released.
class Pipe final
{
public:
    Pipe() = default;
    ~Pipe()
    {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&)            = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] bool open()
    {
        int fds[2] = {-1, -1};
        if (::pipe2(fds, O_CLOEXEC) != 0)
        {
            return false;
        }
        read_  = fds[0];
        write_ = fds[1];
        return true;
    }

    [[nodiscard]] int readEnd() const
    {
        return read_;
    }

    [[nodiscard]] int writeEnd() const
    {
        return write_;
    }

    int releaseRead()
    {
        return std::exchange(read_, -1);
    }

    int releaseWrite()
    {
        return std::exchange(write_, -1);
    }

    void closeRead()
    {
        if (read_ >= 0)
        {
            ::close(std::exchange(read_, -1));
        }
    }

    void closeWrite()
    {
        if (write_ >= 0)
        {
            ::close(std::exchange(write_, -1));
        }
    }

private:
    int read_{-1};
    int write_{-1};
};

/// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void reportChildFailure(const int statusFd, const ChildStage stage)
{
    const int report[2] = {static_cast<int>(stage), errno};
    const ssize_t written = ::write(statusFd, report, sizeof(report));
    static_cast<void>(written);
    ::_exit(127);
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides)
{
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry)
    {
        const auto [name, value] = llvm::StringRef(*entry).split('=');
        merged.emplace(name.str(), value.str());
    }
    for (const auto& [name, value] : overrides)
    {
        merged.insert_or_assign(name, value);
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [name, value] : merged)
    {
        out.push_back(name + "=" + value);
    }
    return out;
}

std::vector<char*> pointerArray(std::vector<std::string>& storage)
{
    std::vector<char*> out;
    out.reserve(storage.size() + 1U);
    for (std::string& item : storage)
    {
        out.push_back(item.data());
    }
    out.push_back(nullptr);
    return out;
}

void reapChild(const pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }
}

}  // namespace

std::string ProcessExit::describe() const
{
    if (signaled)
    {
        const char* name = ::strsignal(code);
        return llvm::formatv("terminated by signal {0} ({1})", code, name ? name : "unknown").str();
    }
    return llvm::formatv("exited with code {0}", code).str();
}

ServerProcess::ServerProcess(const pid_t       pid,
                             const int         stdinFd,
                             const int         stdoutFd,
                             const int         stderrFd,
                             std::string       name,
                             Logger&           logger,
                             const std::size_t tailLines,
                             ExitCallback      onExit)
    : pid_(pid)
    , name_(std::move(name))
    , logger_(logger)
    , tailLines_(tailLines)
    , onExit_(std::move(onExit))
    , input_(stdinFd, true)
    , output_(stdoutFd, true)
{
    stderrThread_  = std::thread([this, stderrFd]() { drainStderr(stderrFd); });
    watcherThread_ = std::thread([this]() { watchExit(); });
}

ServerProcess::~ServerProcess()
{
    if (isAlive())
    {
        static_cast<void>(terminate(std::chrono::milliseconds(200)));
    }
    closeInput();
    if (watcherThread_.joinable())
    {
        watcherThread_.join();
    }
    if (stderrThread_.joinable())
    {
        stderrThread_.join();
    }
}

bool ServerProcess::isAlive() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !exit_.has_value();
}

std::optional<ProcessExit> ServerProcess::exitStatus() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_;
}

void ServerProcess::closeInput()
{
    std::lock_guard<std::mutex> lock(inputMutex_);
    input_.buffer().close();
}

bool ServerProcess::sendSignal(const int signalNumber)
{
    // The child is reaped under `mutex_`, so a live `exit_` check rules out a recycled pid.
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_)
    {
        return false;
    }
    return ::kill(pid_, signalNumber) == 0;
}

ProcessExit ServerProcess::terminate(const std::chrono::milliseconds grace)
{
    closeInput();
    if (!waitForExit(grace))
    {
        logger_.basic(Component, llvm::formatv("sending SIGTERM to {0} (pid {1})", name_, pid_).str());
        sendSignal(SIGTERM);
        if (!waitForExit(grace))
        {
            logger_.basic(Component, llvm::formatv("sending SIGKILL to {0} (pid {1})", name_, pid_).str());
            sendSignal(SIGKILL);
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    exitCv_.wait(lock, [this]() { return exit_.has_value(); });
    return *exit_;
}

bool ServerProcess::waitForExit(const std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return exitCv_.wait_for(lock, timeout, [this]() { return exit_.has_value(); });
}

std::vector<std::string> ServerProcess::stderrTail() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(tail_.begin(), tail_.end());
}

void ServerProcess::watchExit()
{
    siginfo_t info{};
    int       rc = 0;
    do
    {
        rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    ProcessExit exit;
    if (rc == 0)
    {
        exit.signaled = info.si_code != CLD_EXITED;
        exit.code     = info.si_status;
    }
    else
    {
        exit.code = -1;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reapChild(pid_);
        exit_ = exit;
    }
    exitCv_.notify_all();

    logger_.basic(Component, llvm::formatv("{0} (pid {1}) {2}", name_, pid_, exit.describe()).str());
    if (exit.signaled || exit.code != 0)
    {
        for (const std::string& line : stderrTail())
        {
            logger_.basic(StderrComponent, line);
        }
    }
    if (onExit_)
    {
        onExit_(exit);
    }
}

void ServerProcess::drainStderr(const int stderrFd)
{
    FdInputStream stream(stderrFd, true);
    std::string   line;
    while (std::getline(stream, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        logger_.verbose(StderrComponent, line);
        if (tailLines_ == 0U)
        {
            continue;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        tail_.push_back(std::move(line));
        while (tail_.size() > tailLines_)
        {
            tail_.pop_front();
        }
    }
}

ProcessSupervisor::ProcessSupervisor(Logger& logger, const std::size_t stderrTailLines)
    : logger_(logger)
    , stderrTailLines_(stderrTailLines)
{
}

llvm::Expected<std::unique_ptr<ServerProcess>> ProcessSupervisor::start(const ServerCommand& command,
                                                                        ExitCallback         onExit)
{
    if (command.executable.empty())
    {
        return makeClientError(ErrorKind::SpawnFailed, "no server executable configured");
    }
    ignoreBrokenPipeSignal();

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argvStorage;
    argvStorage.reserve(command.arguments.size() + 1U);
    argvStorage.push_back(command.executable);
    argvStorage.insert(argvStorage.end(), command.arguments.begin(), command.arguments.end());
    std::vector<char*>       argv       = pointerArray(argvStorage);
    std::vector<std::string> envStorage = buildEnvironment(command.environment);
    std::vector<char*>       envp       = pointerArray(envStorage);
    const char* workingDirectory = command.workingDirectory.empty() ? nullptr : command.workingDirectory.c_str();

    Pipe stdinPipe;
    Pipe stdoutPipe;
    Pipe stderrPipe;
    Pipe statusPipe;
    if (!stdinPipe.open() || !stdoutPipe.open() || !stderrPipe.open() || !statusPipe.open())
    {
        return makeClientError(ErrorKind::SpawnFailed,
                               "cannot create pipes for '" + command.executable + "': " + std::strerror(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        return makeClientError(ErrorKind::SpawnFailed,
                               "cannot fork for '" + command.executable + "': " + std::strerror(errno));
    }
    if (pid == 0)
    {
        ::signal(SIGPIPE, SIG_DFL);
        if (workingDirectory != nullptr && ::chdir(workingDirectory) != 0)
        {
            reportChildFailure(statusPipe.writeEnd(), ChildStage::ChangeDirectory);
        }
        if (::dup2(stdinPipe.readEnd(), STDIN_FILENO) < 0 || ::dup2(stdoutPipe.writeEnd(), STDOUT_FILENO) < 0 ||
            ::dup2(stderrPipe.writeEnd(), STDERR_FILENO) < 0)
        {
            reportChildFailure(statusPipe.writeEnd(), ChildStage::Exec);
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        reportChildFailure(statusPipe.writeEnd(), ChildStage::Exec);
    }

    stdinPipe.closeRead();
    stdoutPipe.closeWrite();
    stderrPipe.closeWrite();
    statusPipe.closeWrite();

    int     report[2] = {0, 0};
    ssize_t count     = 0;
    do
    {
        count = ::read(statusPipe.readEnd(), report, sizeof(report));
    } while (count < 0 && errno == EINTR);

    if (count > 0)
    {
        reapChild(pid);
        const int   childErrno = report[1];
        std::string message;
        if (static_cast<ChildStage>(report[0]) == ChildStage::ChangeDirectory)
        {
            message = "cannot change directory to '" + command.workingDirectory + "': " + std::strerror(childErrno);
        }
        else
        {
            message = "cannot start '" + command.executable + "': " + std::strerror(childErrno);
        }
        return makeClientError(ErrorKind::SpawnFailed, std::move(message));
    }

    logger_.basic(Component, llvm::formatv("started {0} (pid {1})", command.executable, pid).str());
    return std::unique_ptr<ServerProcess>(new ServerProcess(pid,
                                                            stdinPipe.releaseWrite(),
                                                            stdoutPipe.releaseRead(),
                                                            stderrPipe.releaseRead(),
                                                            command.executable,
                                                            logger_,
                                                            stderrTailLines_,
                                                            std::move(onExit)));
}

}  // namespace lspbridge::lsp
