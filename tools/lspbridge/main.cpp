//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `lspbridge` command-line driver.
///
/// The driver starts one language server, runs a single navigation query
/// against it, prints the typed result as JSON on stdout and shuts the server
/// down again.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Client.h"
#include "lspbridge/LSP/ClientConfig.h"
#include "lspbridge/LSP/Protocol.h"
#include "lspbridge/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

constexpr int UsageExitCode   = 1;
constexpr int FailureExitCode = 2;

/// @brief Checks whether a command token is implemented by `lspbridge`.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "definition" || command == "references" || command == "implementation" ||
           command == "type-definition" || command == "hover" || command == "rename" || command == "symbols" ||
           command == "diagnostics" || command == "pull-diagnostics";
}

/// @brief Commands that act on a position inside the file.
bool needsPosition(llvm::StringRef command)
{
    return command != "symbols" && command != "diagnostics" && command != "pull-diagnostics";
}

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

void printUsage()
{
    llvm::errs() << "Usage: lspbridge <command> --server <executable> --file <path> [--line <N> --column <N>] "
                    "[options]\n"
                 << "Try: lspbridge --help\n";
}

void printHelp()
{
    llvm::errs()
        << "NAME\n"
        << "  lspbridge - run one language-server query and print the result as JSON\n\n"
        << "SYNOPSIS\n"
        << "  lspbridge <command> --server <executable> [--server-arg <arg> ...] --file <path> [options]\n"
        << "  lspbridge <command> --config <settings.json> --file <path> [options]\n"
        << "  lspbridge --help\n"
        << "  lspbridge --version\n\n"
        << "COMMANDS\n"
        << "  definition        Locations defining the symbol at --line/--column.\n"
        << "  references        Locations referencing the symbol, declaration excluded.\n"
        << "  implementation    Implementations of the symbol.\n"
        << "  type-definition   Locations defining the symbol's type.\n"
        << "  hover             Hover text for the symbol.\n"
        << "  rename            Edits renaming the symbol to --new-name. Nothing is written.\n"
        << "  symbols           Document symbols, flattened in pre-order.\n"
        << "  diagnostics       Diagnostics published for the file after it is opened.\n"
        << "  pull-diagnostics  Diagnostics requested with textDocument/diagnostic.\n\n"
        << "OPTIONS\n"
        << "  --server <executable>\n"
        << "      Language-server executable, looked up on PATH.\n"
        << "  --server-arg <arg>\n"
        << "      Argument passed to the server. Repeat as needed.\n"
        << "  --config <file>\n"
        << "      JSON settings document. Command-line options override it.\n"
        << "  --root <dir>\n"
        << "      Workspace root sent during initialize (default: current directory).\n"
        << "  --file <path>\n"
        << "      Document the query applies to.\n"
        << "  --line <N>, --column <N>\n"
        << "      One-indexed position.\n"
        << "  --new-name <name>\n"
        << "      Replacement identifier for rename.\n"
        << "  --timeout-ms <N>\n"
        << "      Request timeout in milliseconds.\n"
        << "  --trace <off|basic|verbose>\n"
        << "      Log level for messages written to stderr.\n"
        << "  --help, -h\n"
        << "      Print this help text.\n\n"
        << "ENVIRONMENT\n"
        << "  LSPBRIDGE_TRACE, LSPBRIDGE_REQUEST_TIMEOUT_MS override the settings document.\n\n"
        << "EXIT STATUS\n"
        << "  0 on success, 1 on usage errors, 2 when the server or the query failed.\n";
}

/// @brief Parses a strictly positive decimal integer option value.
bool parsePositive(llvm::StringRef text, std::int64_t& out)
{
    std::int64_t value = 0;
    if (text.getAsInteger(10, value) || value < 1)
    {
        return false;
    }
    out = value;
    return true;
}

struct Invocation final
{
    std::string                 command;
    std::optional<std::string>  configPath;
    std::optional<std::string>  server;
    std::vector<std::string>    serverArgs;
    std::optional<std::string>  root;
    std::string                 file;
    std::int64_t                line{0};
    std::int64_t                column{0};
    std::string                 newName;
    std::optional<std::int64_t> timeoutMs;
    std::optional<lspbridge::lsp::TraceLevel> trace;
};

int reportFailure(llvm::Error error)
{
    llvm::errs() << "[lspbridge] " << llvm::toString(std::move(error)) << "\n";
    return FailureExitCode;
}

void printJson(const llvm::json::Value& value)
{
    llvm::outs() << llvm::formatv("{0:2}", value) << "\n";
}

template <typename T>
int emit(llvm::Expected<T> result)
{
    if (!result)
    {
        return reportFailure(result.takeError());
    }
    printJson(lspbridge::lsp::toJson(*result));
    return 0;
}

/// @brief Runs the selected query against an initialized client.
int runCommand(lspbridge::lsp::Client& client, const Invocation& invocation)
{
    const std::string&  command = invocation.command;
    const std::string&  file    = invocation.file;
    const std::int64_t  line    = invocation.line;
    const std::int64_t  column  = invocation.column;

    if (command == "definition")
    {
        return emit(client.definition(file, line, column));
    }
    if (command == "references")
    {
        return emit(client.references(file, line, column));
    }
    if (command == "implementation")
    {
        return emit(client.implementation(file, line, column));
    }
    if (command == "type-definition")
    {
        return emit(client.typeDefinition(file, line, column));
    }
    if (command == "hover")
    {
        return emit(client.hover(file, line, column));
    }
    if (command == "rename")
    {
        return emit(client.rename(file, line, column, invocation.newName));
    }
    if (command == "symbols")
    {
        return emit(client.documentSymbols(file));
    }
    if (command == "pull-diagnostics")
    {
        return emit(client.pullDiagnostics(file));
    }
    return emit(client.waitForDiagnostics(file));
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return UsageExitCode;
    }

    Invocation invocation;
    int        argIndex = 1;
    {
        const llvm::StringRef first(argv[1]);
        if (isHelpToken(first))
        {
            printHelp();
            return 0;
        }
        if (first == "--version" || first == "-V")
        {
            llvm::outs() << "lspbridge " << lspbridge::kVersionString << "\n";
            return 0;
        }
        if (!isKnownCommand(first))
        {
            llvm::errs() << "[lspbridge] unknown command '" << first << "'\n";
            printUsage();
            return UsageExitCode;
        }
        invocation.command = first.str();
        ++argIndex;
    }

    for (int i = argIndex; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        if (isHelpToken(arg))
        {
            printHelp();
            return 0;
        }

        auto requireValue = [&](llvm::StringRef name) -> std::optional<llvm::StringRef> {
            if (i + 1 >= argc)
            {
                llvm::errs() << "[lspbridge] " << name << " requires a value\n";
                return std::nullopt;
            }
            return llvm::StringRef(argv[++i]);
        };
        auto requirePositive = [&](llvm::StringRef name, std::int64_t& out) -> bool {
            const auto value = requireValue(name);
            if (!value)
            {
                return false;
            }
            if (!parsePositive(*value, out))
            {
                llvm::errs() << "[lspbridge] " << name << " expects a positive integer, got '" << *value << "'\n";
                return false;
            }
            return true;
        };

        if (arg == "--server" || arg == "--config" || arg == "--root" || arg == "--file" || arg == "--new-name" ||
            arg == "--server-arg" || arg == "--trace")
        {
            const auto value = requireValue(arg);
            if (!value)
            {
                printUsage();
                return UsageExitCode;
            }
            if (arg == "--server")
            {
                invocation.server = value->str();
            }
            else if (arg == "--server-arg")
            {
                invocation.serverArgs.push_back(value->str());
            }
            else if (arg == "--config")
            {
                invocation.configPath = value->str();
            }
            else if (arg == "--root")
            {
                invocation.root = value->str();
            }
            else if (arg == "--file")
            {
                invocation.file = value->str();
            }
            else if (arg == "--new-name")
            {
                invocation.newName = value->str();
            }
            else
            {
                lspbridge::lsp::TraceLevel level = lspbridge::lsp::TraceLevel::Basic;
                if (!lspbridge::lsp::parseTraceLevel(*value, level))
                {
                    llvm::errs() << "[lspbridge] --trace expects off, basic or verbose, got '" << *value << "'\n";
                    return UsageExitCode;
                }
                invocation.trace = level;
            }
            continue;
        }
        if (arg == "--line" || arg == "--column" || arg == "--timeout-ms")
        {
            std::int64_t value = 0;
            if (!requirePositive(arg, value))
            {
                return UsageExitCode;
            }
            if (arg == "--line")
            {
                invocation.line = value;
            }
            else if (arg == "--column")
            {
                invocation.column = value;
            }
            else
            {
                invocation.timeoutMs = value;
            }
            continue;
        }

        llvm::errs() << "[lspbridge] unknown option '" << arg << "'\n";
        printUsage();
        return UsageExitCode;
    }

    if (invocation.file.empty())
    {
        llvm::errs() << "[lspbridge] --file is required\n";
        printUsage();
        return UsageExitCode;
    }
    if (needsPosition(invocation.command) && (invocation.line == 0 || invocation.column == 0))
    {
        llvm::errs() << "[lspbridge] " << invocation.command << " requires --line and --column\n";
        return UsageExitCode;
    }
    if (invocation.command == "rename" && invocation.newName.empty())
    {
        llvm::errs() << "[lspbridge] rename requires --new-name\n";
        return UsageExitCode;
    }

    lspbridge::lsp::ClientConfig config;
    if (invocation.configPath)
    {
        auto loaded = lspbridge::lsp::loadClientConfigFile(*invocation.configPath);
        if (!loaded)
        {
            return reportFailure(loaded.takeError());
        }
        config = std::move(*loaded);
    }
    lspbridge::lsp::applyEnvironmentOverrides(config);
    if (invocation.server)
    {
        config.command.executable = *invocation.server;
        config.command.arguments  = invocation.serverArgs;
    }
    else if (!invocation.serverArgs.empty())
    {
        config.command.arguments = invocation.serverArgs;
    }
    if (invocation.root)
    {
        config.rootPath = *invocation.root;
    }
    if (invocation.timeoutMs)
    {
        config.requestTimeout = std::chrono::milliseconds(*invocation.timeoutMs);
    }
    if (invocation.trace)
    {
        config.traceLevel = *invocation.trace;
    }
    if (config.command.executable.empty())
    {
        llvm::errs() << "[lspbridge] no server configured; pass --server or --config\n";
        printUsage();
        return UsageExitCode;
    }

    lspbridge::lsp::ClientHooks hooks;
    if (config.traceLevel == lspbridge::lsp::TraceLevel::Verbose)
    {
        hooks.metricSink = [](const lspbridge::lsp::RequestMetric& metric) {
            llvm::errs() << "[lspbridge][telemetry] method=" << metric.method << " latency_us=" << metric.latencyMicros
                         << " outcome=" << lspbridge::lsp::requestOutcomeName(metric.outcome) << "\n";
        };
    }

    lspbridge::lsp::Client client(std::move(config), std::move(hooks));
    if (auto error = client.start())
    {
        return reportFailure(std::move(error));
    }

    const int status = runCommand(client, invocation);

    if (auto error = client.shutdown())
    {
        const int shutdownStatus = reportFailure(std::move(error));
        return status == 0 ? shutdownStatus : status;
    }
    return status;
}
