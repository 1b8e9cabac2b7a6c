//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language-server client configuration.
///
/// Settings are read from a JSON document, either a configuration file or an
/// in-memory value, and may be overridden from the environment.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_CLIENT_CONFIG_H
#define LSPBRIDGE_LSP_CLIENT_CONFIG_H

#include "lspbridge/LSP/Logger.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lspbridge::lsp
{

/// @brief How to launch the language server.
struct ServerCommand final
{
    /// @brief Executable name or path, resolved through `PATH`.
    std::string executable;

    /// @brief Arguments after the executable.
    std::vector<std::string> arguments;

    /// @brief Working directory of the child; empty inherits the parent's.
    std::string workingDirectory;

    /// @brief Extra environment variables set in the child.
    std::map<std::string, std::string> environment;
};

/// @brief Mutable runtime configuration for one `Client`.
struct ClientConfig final
{
    /// @brief Server launch command.
    ServerCommand command;

    /// @brief Workspace root sent as `rootUri` and the single workspace folder.
    std::string rootPath;

    /// @brief Opaque `initializationOptions` forwarded with `initialize`.
    std::optional<llvm::json::Value> initializationOptions;

    /// @brief Default bound for typed operations.
    std::chrono::milliseconds requestTimeout{30000};

    /// @brief Bound for the `initialize` handshake.
    std::chrono::milliseconds initializeTimeout{60000};

    /// @brief Bound for the `shutdown` request and for process termination.
    std::chrono::milliseconds shutdownTimeout{5000};

    /// @brief Longest a write to a spawned server may stall before the session is dropped.
    std::chrono::milliseconds writeTimeout{10000};

    /// @brief Maximum wait for a first diagnostics push after opening a document.
    std::chrono::milliseconds diagnosticsWait{2000};

    /// @brief How long identifiers of abandoned calls are remembered.
    std::chrono::milliseconds lateResponseRetention{30000};

    /// @brief Number of server stderr lines retained for failure reports.
    std::size_t stderrTailLines{64};

    /// @brief Configured trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};
};

/// @brief Merges a JSON settings document into `config`.
///
/// Unknown keys are ignored; keys with an unexpected type leave the current
/// value unchanged.
/// @param[in] settings Settings object.
/// @param[in,out] config Configuration instance to update.
/// @return `true` when `settings` was a JSON object.
[[nodiscard]] bool applyClientSettings(const llvm::json::Value& settings, ClientConfig& config);

/// @brief Loads a JSON configuration file on top of the defaults.
/// @param[in] path File path.
/// @return Parsed configuration, or `InvalidArgument` when the file cannot be read or parsed.
[[nodiscard]] llvm::Expected<ClientConfig> loadClientConfigFile(llvm::StringRef path);

/// @brief Applies `LSPBRIDGE_TRACE` and `LSPBRIDGE_REQUEST_TIMEOUT_MS` when set.
/// @param[in,out] config Configuration instance to update.
void applyEnvironmentOverrides(ClientConfig& config);

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_CLIENT_CONFIG_H
