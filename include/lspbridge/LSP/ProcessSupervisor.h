//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language-server subprocess lifecycle.
///
/// The supervisor spawns the server with its stdin and stdout connected to
/// pipes, drains stderr into the log on a dedicated thread, and watches for
/// process exit on another. No restart is attempted; exit is reported once
/// through the callback supplied at spawn time.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_PROCESS_SUPERVISOR_H
#define LSPBRIDGE_LSP_PROCESS_SUPERVISOR_H

#include "lspbridge/LSP/ClientConfig.h"
#include "lspbridge/LSP/FdStream.h"
#include "lspbridge/LSP/Logger.h"
#include "llvm/Support/Error.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace lspbridge::lsp
{

/// @brief How a server process ended.
struct ProcessExit final
{
    /// @brief `true` when terminated by a signal.
    bool signaled{false};

    /// @brief Exit code, or signal number when `signaled`.
    int code{0};

    /// @brief Returns a short description such as `exited with code 1`.
    [[nodiscard]] std::string describe() const;
};

/// @brief Callback invoked once on the watcher thread when the process exits.
using ExitCallback = std::function<void(const ProcessExit& exit)>;

/// @brief Handle to one running language-server process.
class ServerProcess final
{
public:
    /// @brief Terminates the process if still running and joins helper threads.
    ~ServerProcess();

    ServerProcess(const ServerProcess&)            = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    /// @brief Stream connected to the server's stdin.
    [[nodiscard]] std::ostream& input()
    {
        return input_;
    }

    /// @brief Stream connected to the server's stdout.
    [[nodiscard]] std::istream& output()
    {
        return output_;
    }

    [[nodiscard]] pid_t pid() const
    {
        return pid_;
    }

    /// @brief Returns whether the process is still running.
    [[nodiscard]] bool isAlive() const;

    /// @brief Returns the exit status once the process has ended.
    [[nodiscard]] std::optional<ProcessExit> exitStatus() const;

    /// @brief Bounds how long a write to the server's stdin may stall.
    void setInputWriteTimeout(std::chrono::milliseconds timeout)
    {
        input_.buffer().setWriteTimeout(timeout);
    }

    /// @brief Flushes and closes the server's stdin. Idempotent.
    ///
    /// Callers writing through `input()` on other threads must be stopped first.
    void closeInput();

    /// @brief Stops the process: closes stdin, then `SIGTERM`, then `SIGKILL`.
    /// @param[in] grace Wait after each step before escalating.
    /// @return Final exit status.
    ProcessExit terminate(std::chrono::milliseconds grace);

    /// @brief Waits for exit up to `timeout`.
    /// @return `true` when the process has exited.
    [[nodiscard]] bool waitForExit(std::chrono::milliseconds timeout) const;

    /// @brief Returns the most recent stderr lines, oldest first.
    [[nodiscard]] std::vector<std::string> stderrTail() const;

private:
    friend class ProcessSupervisor;

    ServerProcess(pid_t        pid,
                  int          stdinFd,
                  int          stdoutFd,
                  int          stderrFd,
                  std::string  name,
                  Logger&      logger,
                  std::size_t  tailLines,
                  ExitCallback onExit);

    void watchExit();
    void drainStderr(int stderrFd);
    bool sendSignal(int signalNumber);

    const pid_t                     pid_;
    const std::string               name_;
    Logger&                         logger_;
    const std::size_t               tailLines_;
    ExitCallback                    onExit_;
    FdOutputStream                  input_;
    FdInputStream                   output_;
    mutable std::mutex              mutex_;
    mutable std::condition_variable exitCv_;
    std::optional<ProcessExit>      exit_;
    std::deque<std::string>         tail_;
    std::mutex                      inputMutex_;
    std::thread                     stderrThread_;
    std::thread                     watcherThread_;
};

/// @brief Spawns language-server processes.
class ProcessSupervisor final
{
public:
    /// @brief Creates a supervisor.
    /// @param[in] logger Log router receiving server stderr.
    /// @param[in] stderrTailLines Number of stderr lines each process retains.
    ProcessSupervisor(Logger& logger, std::size_t stderrTailLines);

    /// @brief Spawns `command` with piped stdio.
    /// @param[in] command Launch description.
    /// @param[in] onExit Callback invoked once when the process exits.
    /// @return Running process, or `SpawnFailed` when it could not be started.
    [[nodiscard]] llvm::Expected<std::unique_ptr<ServerProcess>> start(const ServerCommand& command,
                                                                       ExitCallback         onExit);

private:
    Logger&     logger_;
    std::size_t stderrTailLines_;
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_PROCESS_SUPERVISOR_H
