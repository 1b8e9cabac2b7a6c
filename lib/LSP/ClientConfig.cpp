//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements client configuration parsing.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/ClientConfig.h"

#include "lspbridge/LSP/ClientError.h"

#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Process.h"

#include <optional>

namespace lspbridge::lsp
{
namespace
{

std::optional<std::vector<std::string>> parseStringArrayValue(const llvm::json::Value& value)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }

    std::vector<std::string> out;
    out.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return std::nullopt;
        }
        out.emplace_back(text->str());
    }
    return out;
}

void applyDuration(const llvm::json::Object& object, llvm::StringRef key, std::chrono::milliseconds& outValue)
{
    if (const auto millis = object.getInteger(key))
    {
        if (*millis > 0)
        {
            outValue = std::chrono::milliseconds(*millis);
        }
    }
}

void applyCommand(const llvm::json::Value& commandValue, ServerCommand& command)
{
    // Shorthand: ["clangd", "--background-index"].
    if (const auto argv = parseStringArrayValue(commandValue))
    {
        if (argv->empty())
        {
            return;
        }
        command.executable = argv->front();
        command.arguments.assign(argv->begin() + 1, argv->end());
        return;
    }

    const auto* object = commandValue.getAsObject();
    if (!object)
    {
        return;
    }
    if (const auto executable = object->getString("executable"))
    {
        command.executable = executable->str();
    }
    if (const auto* argumentsValue = object->get("arguments"))
    {
        if (const auto arguments = parseStringArrayValue(*argumentsValue))
        {
            command.arguments = *arguments;
        }
    }
    if (const auto workingDirectory = object->getString("workingDirectory"))
    {
        command.workingDirectory = workingDirectory->str();
    }
    if (const auto* environment = object->getObject("environment"))
    {
        command.environment.clear();
        for (const auto& [name, value] : *environment)
        {
            if (const auto text = value.getAsString())
            {
                command.environment.insert_or_assign(name.str(), text->str());
            }
        }
    }
}

void applyTimeouts(const llvm::json::Object& settings, ClientConfig& config)
{
    const auto* timeouts = settings.getObject("timeouts");
    if (!timeouts)
    {
        return;
    }
    applyDuration(*timeouts, "requestMs", config.requestTimeout);
    applyDuration(*timeouts, "initializeMs", config.initializeTimeout);
    applyDuration(*timeouts, "shutdownMs", config.shutdownTimeout);
    applyDuration(*timeouts, "writeMs", config.writeTimeout);
    applyDuration(*timeouts, "diagnosticsWaitMs", config.diagnosticsWait);
    applyDuration(*timeouts, "lateResponseRetentionMs", config.lateResponseRetention);
}

}  // namespace

bool applyClientSettings(const llvm::json::Value& settings, ClientConfig& config)
{
    const auto* object = settings.getAsObject();
    if (!object)
    {
        return false;
    }

    if (const auto* commandValue = object->get("command"))
    {
        applyCommand(*commandValue, config.command);
    }
    if (const auto rootPath = object->getString("rootPath"))
    {
        config.rootPath = rootPath->str();
    }
    if (const auto* options = object->get("initializationOptions"))
    {
        config.initializationOptions = *options;
    }
    applyTimeouts(*object, config);
    if (const auto tailLines = object->getInteger("stderrTailLines"))
    {
        if (*tailLines >= 0)
        {
            config.stderrTailLines = static_cast<std::size_t>(*tailLines);
        }
    }
    if (const auto rawTrace = object->getString("trace"))
    {
        TraceLevel level = TraceLevel::Basic;
        if (parseTraceLevel(*rawTrace, level))
        {
            config.traceLevel = level;
        }
    }
    return true;
}

llvm::Expected<ClientConfig> loadClientConfigFile(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!buffer)
    {
        return makeClientError(ErrorKind::InvalidArgument,
                               "cannot read configuration '" + path.str() + "': " + buffer.getError().message());
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        return makeClientError(ErrorKind::InvalidArgument,
                               "invalid configuration '" + path.str() + "': " + llvm::toString(parsed.takeError()));
    }

    ClientConfig config;
    if (!applyClientSettings(*parsed, config))
    {
        return makeClientError(ErrorKind::InvalidArgument,
                               "invalid configuration '" + path.str() + "': expected a JSON object");
    }
    return config;
}

void applyEnvironmentOverrides(ClientConfig& config)
{
    if (const auto trace = llvm::sys::Process::GetEnv("LSPBRIDGE_TRACE"))
    {
        TraceLevel level = TraceLevel::Basic;
        if (parseTraceLevel(*trace, level))
        {
            config.traceLevel = level;
        }
    }
    if (const auto timeout = llvm::sys::Process::GetEnv("LSPBRIDGE_REQUEST_TIMEOUT_MS"))
    {
        std::int64_t millis = 0;
        if (!llvm::StringRef(*timeout).trim().getAsInteger(10, millis) && millis > 0)
        {
            config.requestTimeout = std::chrono::milliseconds(millis);
        }
    }
}

}  // namespace lspbridge::lsp
