//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements protocol message construction and result normalization.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Protocol.h"

#include "lspbridge/LSP/ClientError.h"
#include "lspbridge/LSP/Uri.h"

#include "llvm/Support/FormatVariadic.h"

#include <algorithm>
#include <limits>
#include <map>
#include <string>
#include <tuple>
#include <utility>

namespace lspbridge::lsp
{
namespace
{

llvm::Error invalidResponse(const llvm::Twine& what)
{
    return makeClientError(ErrorKind::InvalidResponse, what.str());
}

constexpr std::int64_t MaxCoordinate = std::numeric_limits<std::uint32_t>::max();

bool positionLess(const SourcePosition& lhs, const SourcePosition& rhs)
{
    return std::tie(lhs.line, lhs.column) < std::tie(rhs.line, rhs.column);
}

llvm::json::Value sourcePositionToJson(const SourcePosition& position)
{
    return llvm::json::Object{
        {"line", static_cast<std::int64_t>(position.line)},
        {"column", static_cast<std::int64_t>(position.column)},
    };
}

llvm::json::Value sourceRangeToJson(const SourceRange& range)
{
    return llvm::json::Object{
        {"start", sourcePositionToJson(range.start)},
        {"end", sourcePositionToJson(range.end)},
    };
}

std::string pathForUri(llvm::StringRef uri)
{
    if (auto path = uriToPath(uri))
    {
        return *path;
    }
    return std::string();
}

llvm::Expected<Location> decodeLocationObject(const llvm::json::Object& object)
{
    const auto uri = object.getString("uri");
    if (!uri)
    {
        return invalidResponse("location without uri");
    }
    const auto* rangeValue = object.get("range");
    const auto  range      = rangeValue ? fromWireRange(*rangeValue) : std::nullopt;
    if (!range)
    {
        return invalidResponse(llvm::formatv("location for '{0}' has no valid range", *uri));
    }
    return Location{uri->str(), pathForUri(*uri), *range};
}

llvm::Expected<Location> decodeLocationLinkObject(const llvm::json::Object& object)
{
    const auto uri = object.getString("targetUri");
    if (!uri)
    {
        return invalidResponse("location link without targetUri");
    }
    std::optional<SourceRange> range;
    if (const auto* selection = object.get("targetSelectionRange"))
    {
        range = fromWireRange(*selection);
    }
    if (!range)
    {
        if (const auto* target = object.get("targetRange"))
        {
            range = fromWireRange(*target);
        }
    }
    if (!range)
    {
        return invalidResponse(llvm::formatv("location link for '{0}' has no valid range", *uri));
    }
    return Location{uri->str(), pathForUri(*uri), *range};
}

std::optional<std::string> markedStringText(const llvm::json::Value& value)
{
    if (const auto text = value.getAsString())
    {
        return text->str();
    }
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto text = object->getString("value");
    if (!text)
    {
        return std::nullopt;
    }
    if (const auto language = object->getString("language"))
    {
        return llvm::formatv("```{0}\n{1}\n```", *language, *text).str();
    }
    return text->str();
}

llvm::Expected<std::vector<TextEdit>> decodeTextEdits(const llvm::json::Value& value, llvm::StringRef uri)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return invalidResponse(llvm::formatv("edits for '{0}' are not an array", uri));
    }
    std::vector<TextEdit> edits;
    edits.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto* object = item.getAsObject();
        if (!object)
        {
            return invalidResponse(llvm::formatv("edit for '{0}' is not an object", uri));
        }
        const auto* rangeValue = object->get("range");
        const auto  range      = rangeValue ? fromWireRange(*rangeValue) : std::nullopt;
        const auto  newText    = object->getString("newText");
        if (!range || !newText)
        {
            return invalidResponse(llvm::formatv("malformed text edit for '{0}'", uri));
        }
        edits.push_back(TextEdit{*range, newText->str()});
    }
    return edits;
}

void appendDocumentSymbols(const llvm::json::Array&  symbols,
                           const std::uint32_t       depth,
                           const std::string&        containerName,
                           std::vector<SymbolEntry>& out)
{
    for (const llvm::json::Value& item : symbols)
    {
        const auto* object = item.getAsObject();
        if (!object)
        {
            continue;
        }
        SymbolEntry entry;
        if (const auto name = object->getString("name"))
        {
            entry.name = name->str();
        }
        if (const auto detail = object->getString("detail"))
        {
            entry.detail = detail->str();
        }
        if (const auto kind = object->getInteger("kind"))
        {
            entry.kind = *kind;
        }
        if (const auto* range = object->get("range"))
        {
            if (const auto decoded = fromWireRange(*range))
            {
                entry.range = *decoded;
            }
        }
        entry.selectionRange = entry.range;
        if (const auto* selection = object->get("selectionRange"))
        {
            if (const auto decoded = fromWireRange(*selection))
            {
                entry.selectionRange = *decoded;
            }
        }
        entry.depth         = depth;
        entry.containerName = containerName;
        const std::string parentName = entry.name;
        out.push_back(std::move(entry));

        if (const auto* children = object->getArray("children"))
        {
            appendDocumentSymbols(*children, depth + 1U, parentName, out);
        }
    }
}

}  // namespace

MessageKind classifyMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return MessageKind::Invalid;
    }
    if (const auto* method = object->get("method"))
    {
        if (!method->getAsString())
        {
            return MessageKind::Invalid;
        }
        return object->get("id") ? MessageKind::Request : MessageKind::Notification;
    }
    if (object->get("id") && (object->get("result") || object->get("error")))
    {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

std::optional<std::int64_t> integerMessageId(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    if (const auto id = object->getInteger("id"))
    {
        return *id;
    }
    return std::nullopt;
}

llvm::json::Value cloneJsonId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return llvm::json::Value(text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return llvm::json::Value(*integer);
    }
    if (const auto number = id.getAsNumber())
    {
        return llvm::json::Value(*number);
    }
    return llvm::json::Value(nullptr);
}

llvm::json::Value makeRequest(const std::int64_t id, const llvm::StringRef method, llvm::json::Value params)
{
    llvm::json::Object request{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method.str()},
    };
    // JSON-RPC 2.0 only allows structured params; `null` means "omit".
    if (params.kind() != llvm::json::Value::Null)
    {
        request["params"] = std::move(params);
    }
    return request;
}

llvm::json::Value makeNotification(const llvm::StringRef method, llvm::json::Value params)
{
    llvm::json::Object notification{
        {"jsonrpc", "2.0"},
        {"method", method.str()},
    };
    if (params.kind() != llvm::json::Value::Null)
    {
        notification["params"] = std::move(params);
    }
    return notification;
}

llvm::json::Value makeResultResponse(const llvm::json::Value& id, llvm::json::Value result)
{
    return llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"result", std::move(result)},
    };
}

llvm::json::Value makeErrorResponse(const llvm::json::Value& id, const int code, const llvm::StringRef message)
{
    return llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"error", llvm::json::Object{{"code", code}, {"message", message.str()}}},
    };
}

llvm::Expected<SourcePosition> makeSourcePosition(const std::int64_t line, const std::int64_t column)
{
    if (line < 1 || column < 1)
    {
        return makeClientError(ErrorKind::InvalidArgument,
                               llvm::formatv("line and column are one-indexed, got {0}:{1}", line, column).str());
    }
    if (line > MaxCoordinate || column > MaxCoordinate)
    {
        return makeClientError(ErrorKind::InvalidArgument,
                               llvm::formatv("position {0}:{1} is out of range", line, column).str());
    }
    return SourcePosition{static_cast<std::uint32_t>(line), static_cast<std::uint32_t>(column)};
}

llvm::json::Value toWirePosition(const SourcePosition& position)
{
    return llvm::json::Object{
        {"line", static_cast<std::int64_t>(position.line) - 1},
        {"character", static_cast<std::int64_t>(position.column) - 1},
    };
}

std::optional<SourcePosition> fromWirePosition(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto line      = object->getInteger("line");
    const auto character = object->getInteger("character");
    // One-indexed results must still fit the 32-bit coordinates.
    if (!line || !character || *line < 0 || *character < 0 || *line >= MaxCoordinate || *character >= MaxCoordinate)
    {
        return std::nullopt;
    }
    return SourcePosition{static_cast<std::uint32_t>(*line + 1), static_cast<std::uint32_t>(*character + 1)};
}

std::optional<SourceRange> fromWireRange(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto* startValue = object->get("start");
    const auto* endValue   = object->get("end");
    if (!startValue || !endValue)
    {
        return std::nullopt;
    }
    const auto start = fromWirePosition(*startValue);
    const auto end   = fromWirePosition(*endValue);
    if (!start || !end)
    {
        return std::nullopt;
    }
    return SourceRange{*start, *end};
}

llvm::json::Object textDocumentPositionParams(const llvm::StringRef uri, const SourcePosition& position)
{
    return llvm::json::Object{
        {"textDocument", llvm::json::Object{{"uri", uri.str()}}},
        {"position", toWirePosition(position)},
    };
}

llvm::Expected<std::vector<Location>> decodeLocations(const llvm::json::Value& result)
{
    std::vector<Location> locations;
    if (result.getAsNull())
    {
        return locations;
    }

    if (const auto* object = result.getAsObject())
    {
        auto location = object->getString("targetUri") ? decodeLocationLinkObject(*object)
                                                         : decodeLocationObject(*object);
        if (!location)
        {
            return location.takeError();
        }
        locations.push_back(std::move(*location));
        return locations;
    }

    const auto* array = result.getAsArray();
    if (!array)
    {
        return invalidResponse("location result is neither null, an object nor an array");
    }
    locations.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto* object = item.getAsObject();
        if (!object)
        {
            return invalidResponse("location array element is not an object");
        }
        auto location = object->getString("targetUri") ? decodeLocationLinkObject(*object)
                                                         : decodeLocationObject(*object);
        if (!location)
        {
            return location.takeError();
        }
        locations.push_back(std::move(*location));
    }
    return locations;
}

llvm::Expected<std::optional<HoverResult>> decodeHover(const llvm::json::Value& result)
{
    if (result.getAsNull())
    {
        return std::optional<HoverResult>();
    }
    const auto* object = result.getAsObject();
    if (!object)
    {
        return invalidResponse("hover result is not an object");
    }
    const auto* contents = object->get("contents");
    if (!contents)
    {
        return invalidResponse("hover result without contents");
    }

    HoverResult hover;
    if (const auto* markup = contents->getAsObject(); markup && markup->getString("kind"))
    {
        hover.kind = markup->getString("kind")->str();
        if (const auto value = markup->getString("value"))
        {
            hover.contents = value->str();
        }
    }
    else if (const auto* parts = contents->getAsArray())
    {
        hover.kind = "markdown";
        for (const llvm::json::Value& part : *parts)
        {
            const auto text = markedStringText(part);
            if (!text || text->empty())
            {
                continue;
            }
            if (!hover.contents.empty())
            {
                hover.contents += "\n\n";
            }
            hover.contents += *text;
        }
    }
    else if (const auto text = markedStringText(*contents))
    {
        hover.kind     = "markdown";
        hover.contents = *text;
    }
    else
    {
        return invalidResponse("hover contents have an unsupported shape");
    }

    if (const auto* range = object->get("range"))
    {
        hover.range = fromWireRange(*range);
    }
    if (hover.contents.empty())
    {
        return std::optional<HoverResult>();
    }
    return std::optional<HoverResult>(std::move(hover));
}

llvm::Expected<WorkspaceEditSet> decodeWorkspaceEdit(const llvm::json::Value& result)
{
    WorkspaceEditSet editSet;
    if (result.getAsNull())
    {
        return editSet;
    }
    const auto* object = result.getAsObject();
    if (!object)
    {
        return invalidResponse("workspace edit is not an object");
    }

    std::map<std::string, std::vector<TextEdit>> byUri;
    if (const auto* documentChanges = object->getArray("documentChanges"))
    {
        for (const llvm::json::Value& change : *documentChanges)
        {
            const auto* changeObject = change.getAsObject();
            if (!changeObject)
            {
                return invalidResponse("documentChanges element is not an object");
            }
            // Resource operations (create/rename/delete) carry `kind` and no text edits.
            if (changeObject->getString("kind"))
            {
                continue;
            }
            const auto* textDocument = changeObject->getObject("textDocument");
            const auto* edits        = changeObject->get("edits");
            if (!textDocument || !edits)
            {
                return invalidResponse("documentChanges element without textDocument or edits");
            }
            const auto uri = textDocument->getString("uri");
            if (!uri)
            {
                return invalidResponse("documentChanges element without textDocument uri");
            }
            auto decoded = decodeTextEdits(*edits, *uri);
            if (!decoded)
            {
                return decoded.takeError();
            }
            auto& target = byUri[uri->str()];
            target.insert(target.end(), decoded->begin(), decoded->end());
        }
    }
    else if (const auto* changes = object->getObject("changes"))
    {
        for (const auto& [uri, edits] : *changes)
        {
            auto decoded = decodeTextEdits(edits, uri);
            if (!decoded)
            {
                return decoded.takeError();
            }
            auto& target = byUri[uri.str()];
            target.insert(target.end(), decoded->begin(), decoded->end());
        }
    }

    for (auto& [uri, edits] : byUri)
    {
        std::stable_sort(edits.begin(), edits.end(), [](const TextEdit& lhs, const TextEdit& rhs) {
            return positionLess(lhs.range.start, rhs.range.start);
        });
        for (std::size_t index = 1; index < edits.size(); ++index)
        {
            if (positionLess(edits[index].range.start, edits[index - 1].range.end))
            {
                return invalidResponse(llvm::formatv("overlapping edits for '{0}' at {1}:{2}",
                                                     uri,
                                                     edits[index].range.start.line,
                                                     edits[index].range.start.column));
            }
        }
        editSet.files.push_back(FileEdits{uri, pathForUri(uri), std::move(edits)});
    }
    return editSet;
}

llvm::Expected<std::vector<SymbolEntry>> decodeDocumentSymbols(const llvm::json::Value& result)
{
    std::vector<SymbolEntry> symbols;
    if (result.getAsNull())
    {
        return symbols;
    }
    const auto* array = result.getAsArray();
    if (!array)
    {
        return invalidResponse("document symbol result is not an array");
    }
    if (array->empty())
    {
        return symbols;
    }

    const auto* first = (*array)[0].getAsObject();
    if (first && first->getObject("location"))
    {
        for (const llvm::json::Value& item : *array)
        {
            const auto* object = item.getAsObject();
            if (!object)
            {
                continue;
            }
            const auto* location = object->getObject("location");
            const auto* range    = location ? location->get("range") : nullptr;
            const auto  decoded  = range ? fromWireRange(*range) : std::nullopt;
            if (!decoded)
            {
                return invalidResponse("symbol information without a valid location range");
            }
            SymbolEntry entry;
            if (const auto name = object->getString("name"))
            {
                entry.name = name->str();
            }
            if (const auto kind = object->getInteger("kind"))
            {
                entry.kind = *kind;
            }
            if (const auto container = object->getString("containerName"))
            {
                entry.containerName = container->str();
            }
            entry.range          = *decoded;
            entry.selectionRange = *decoded;
            symbols.push_back(std::move(entry));
        }
        return symbols;
    }

    appendDocumentSymbols(*array, 0U, std::string(), symbols);
    return symbols;
}

llvm::Expected<std::vector<DiagnosticEntry>> decodeDiagnostics(const llvm::json::Value& array)
{
    const auto* items = array.getAsArray();
    if (!items)
    {
        return invalidResponse("diagnostics are not an array");
    }
    std::vector<DiagnosticEntry> diagnostics;
    diagnostics.reserve(items->size());
    for (const llvm::json::Value& item : *items)
    {
        const auto* object = item.getAsObject();
        if (!object)
        {
            return invalidResponse("diagnostic is not an object");
        }
        const auto* rangeValue = object->get("range");
        const auto  range      = rangeValue ? fromWireRange(*rangeValue) : std::nullopt;
        const auto  message    = object->getString("message");
        if (!range || !message)
        {
            return invalidResponse("diagnostic without range or message");
        }
        DiagnosticEntry entry;
        entry.range   = *range;
        entry.message = message->str();
        if (const auto severity = object->getInteger("severity"); severity && *severity >= 1 && *severity <= 4)
        {
            entry.severity = static_cast<DiagnosticSeverity>(*severity);
        }
        if (const auto* code = object->get("code"))
        {
            if (const auto text = code->getAsString())
            {
                entry.code = text->str();
            }
            else if (const auto number = code->getAsInteger())
            {
                entry.code = std::to_string(*number);
            }
        }
        if (const auto source = object->getString("source"))
        {
            entry.source = source->str();
        }
        diagnostics.push_back(std::move(entry));
    }
    return diagnostics;
}

llvm::json::Value toJson(const std::vector<Location>& locations)
{
    llvm::json::Array out;
    for (const Location& location : locations)
    {
        out.push_back(llvm::json::Object{
            {"uri", location.uri},
            {"path", location.path},
            {"range", sourceRangeToJson(location.range)},
        });
    }
    return out;
}

llvm::json::Value toJson(const WorkspaceEditSet& edits)
{
    llvm::json::Array files;
    for (const FileEdits& file : edits.files)
    {
        llvm::json::Array fileEdits;
        for (const TextEdit& edit : file.edits)
        {
            fileEdits.push_back(llvm::json::Object{
                {"range", sourceRangeToJson(edit.range)},
                {"newText", edit.newText},
            });
        }
        files.push_back(llvm::json::Object{
            {"uri", file.uri},
            {"path", file.path},
            {"edits", std::move(fileEdits)},
        });
    }
    return llvm::json::Object{{"files", std::move(files)}};
}

llvm::json::Value toJson(const DiagnosticSet& diagnostics)
{
    llvm::json::Array entries;
    for (const DiagnosticEntry& entry : diagnostics.diagnostics)
    {
        llvm::json::Object object{
            {"severity", static_cast<int>(entry.severity)},
            {"range", sourceRangeToJson(entry.range)},
            {"message", entry.message},
        };
        if (entry.code)
        {
            object["code"] = *entry.code;
        }
        if (!entry.source.empty())
        {
            object["source"] = entry.source;
        }
        entries.push_back(std::move(object));
    }
    return llvm::json::Object{
        {"uri", diagnostics.uri},
        {"diagnostics", std::move(entries)},
    };
}

llvm::json::Value toJson(const std::vector<SymbolEntry>& symbols)
{
    llvm::json::Array out;
    for (const SymbolEntry& symbol : symbols)
    {
        out.push_back(llvm::json::Object{
            {"name", symbol.name},
            {"detail", symbol.detail},
            {"kind", symbol.kind},
            {"depth", static_cast<std::int64_t>(symbol.depth)},
            {"containerName", symbol.containerName},
            {"range", sourceRangeToJson(symbol.range)},
            {"selectionRange", sourceRangeToJson(symbol.selectionRange)},
        });
    }
    return out;
}

llvm::json::Value toJson(const std::optional<HoverResult>& hover)
{
    if (!hover)
    {
        return llvm::json::Value(nullptr);
    }
    llvm::json::Object out{
        {"kind", hover->kind},
        {"contents", hover->contents},
    };
    if (hover->range)
    {
        out["range"] = sourceRangeToJson(*hover->range);
    }
    return out;
}

}  // namespace lspbridge::lsp
