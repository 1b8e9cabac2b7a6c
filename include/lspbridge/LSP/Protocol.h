//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed protocol data and JSON encoding/decoding for the LSP client.
///
/// Positions exposed to callers are one-indexed (`SourcePosition`); positions
/// on the wire are zero-indexed. Conversion happens only in this module. Result
/// payloads that the protocol allows in several shapes are normalized here and
/// never leave this module as unresolved unions.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_PROTOCOL_H
#define LSPBRIDGE_LSP_PROTOCOL_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lspbridge::lsp
{

/// @brief Protocol method names used by the client.
namespace methods
{
inline constexpr llvm::StringLiteral Initialize{"initialize"};
inline constexpr llvm::StringLiteral Initialized{"initialized"};
inline constexpr llvm::StringLiteral Shutdown{"shutdown"};
inline constexpr llvm::StringLiteral Exit{"exit"};
inline constexpr llvm::StringLiteral CancelRequest{"$/cancelRequest"};
inline constexpr llvm::StringLiteral Progress{"$/progress"};
inline constexpr llvm::StringLiteral DidOpen{"textDocument/didOpen"};
inline constexpr llvm::StringLiteral DidChange{"textDocument/didChange"};
inline constexpr llvm::StringLiteral DidClose{"textDocument/didClose"};
inline constexpr llvm::StringLiteral Definition{"textDocument/definition"};
inline constexpr llvm::StringLiteral References{"textDocument/references"};
inline constexpr llvm::StringLiteral Implementation{"textDocument/implementation"};
inline constexpr llvm::StringLiteral TypeDefinition{"textDocument/typeDefinition"};
inline constexpr llvm::StringLiteral Hover{"textDocument/hover"};
inline constexpr llvm::StringLiteral Rename{"textDocument/rename"};
inline constexpr llvm::StringLiteral DocumentSymbol{"textDocument/documentSymbol"};
inline constexpr llvm::StringLiteral Diagnostic{"textDocument/diagnostic"};
inline constexpr llvm::StringLiteral PublishDiagnostics{"textDocument/publishDiagnostics"};
inline constexpr llvm::StringLiteral LogMessage{"window/logMessage"};
inline constexpr llvm::StringLiteral ShowMessage{"window/showMessage"};
inline constexpr llvm::StringLiteral WorkDoneProgressCreate{"window/workDoneProgress/create"};
inline constexpr llvm::StringLiteral Configuration{"workspace/configuration"};
inline constexpr llvm::StringLiteral ApplyEdit{"workspace/applyEdit"};
inline constexpr llvm::StringLiteral RegisterCapability{"client/registerCapability"};
inline constexpr llvm::StringLiteral UnregisterCapability{"client/unregisterCapability"};
}  // namespace methods

/// @brief JSON-RPC error codes used by client and server.
namespace rpc_errors
{
inline constexpr int ParseError           = -32700;
inline constexpr int InvalidRequest       = -32600;
inline constexpr int MethodNotFound       = -32601;
inline constexpr int InvalidParams        = -32602;
inline constexpr int InternalError        = -32603;
inline constexpr int ServerNotInitialized = -32002;
inline constexpr int RequestCancelled     = -32800;
inline constexpr int ContentModified      = -32801;
}  // namespace rpc_errors

/// @brief One-indexed line/column as exposed to callers.
struct SourcePosition final
{
    std::uint32_t line{1};
    std::uint32_t column{1};
};

/// @brief One-indexed half-open range.
struct SourceRange final
{
    SourcePosition start;
    SourcePosition end;
};

/// @brief Normalized result location.
struct Location final
{
    /// @brief Document URI as reported by the server.
    std::string uri;

    /// @brief Filesystem path decoded from `uri`; empty for non-file URIs.
    std::string path;

    /// @brief One-indexed range.
    SourceRange range;
};

/// @brief Single text replacement.
struct TextEdit final
{
    SourceRange range;
    std::string newText;
};

/// @brief Ordered edits for one document.
struct FileEdits final
{
    std::string           uri;
    std::string           path;
    std::vector<TextEdit> edits;
};

/// @brief Structured edit set returned by rename.
///
/// Files are ordered by URI; edits inside a file are ordered by start position.
struct WorkspaceEditSet final
{
    std::vector<FileEdits> files;
};

/// @brief Diagnostic severity as defined by the protocol.
enum class DiagnosticSeverity
{
    Error       = 1,
    Warning     = 2,
    Information = 3,
    Hint        = 4,
};

/// @brief One diagnostic entry.
struct DiagnosticEntry final
{
    DiagnosticSeverity         severity{DiagnosticSeverity::Error};
    SourceRange                range;
    std::string                message;
    std::optional<std::string> code;
    std::string                source;
};

/// @brief Ordering stamp used to discard stale diagnostic pushes.
struct DiagnosticStamp final
{
    /// @brief Document version reported with the push, when present.
    std::optional<std::int64_t> documentVersion;

    /// @brief Receipt sequence assigned on arrival.
    std::uint64_t sequence{0};
};

/// @brief Latest diagnostics for one URI.
struct DiagnosticSet final
{
    std::string                  uri;
    std::vector<DiagnosticEntry> diagnostics;
    DiagnosticStamp              stamp;
};

/// @brief Hover payload.
struct HoverResult final
{
    /// @brief Hover text, markdown or plaintext.
    std::string contents;

    /// @brief `markdown` or `plaintext`.
    std::string kind{"plaintext"};

    /// @brief Optional one-indexed range the hover applies to.
    std::optional<SourceRange> range;
};

/// @brief Flattened document symbol.
struct SymbolEntry final
{
    std::string   name;
    std::string   detail;
    std::int64_t  kind{0};
    SourceRange   range;
    SourceRange   selectionRange;
    std::uint32_t depth{0};
    std::string   containerName;
};

/// @brief JSON-RPC message category.
enum class MessageKind
{
    Request,
    Response,
    Notification,
    Invalid,
};

/// @brief Classifies a decoded JSON-RPC payload.
/// @param[in] message Parsed payload.
/// @return Message kind; `Invalid` when neither a method nor a response id is present.
[[nodiscard]] MessageKind classifyMessage(const llvm::json::Value& message);

/// @brief Reads an integer response id.
/// @param[in] message Response object.
/// @return Id when it is an integer.
[[nodiscard]] std::optional<std::int64_t> integerMessageId(const llvm::json::Value& message);

/// @brief Copies a JSON-RPC id value (integer or string).
[[nodiscard]] llvm::json::Value cloneJsonId(const llvm::json::Value& id);

[[nodiscard]] llvm::json::Value makeRequest(std::int64_t id, llvm::StringRef method, llvm::json::Value params);
[[nodiscard]] llvm::json::Value makeNotification(llvm::StringRef method, llvm::json::Value params);
[[nodiscard]] llvm::json::Value makeResultResponse(const llvm::json::Value& id, llvm::json::Value result);
[[nodiscard]] llvm::json::Value makeErrorResponse(const llvm::json::Value& id, int code, llvm::StringRef message);

/// @brief Validates a caller position.
/// @param[in] line One-indexed line.
/// @param[in] column One-indexed column.
/// @return Position, or `InvalidArgument` when either coordinate is below one.
[[nodiscard]] llvm::Expected<SourcePosition> makeSourcePosition(std::int64_t line, std::int64_t column);

/// @brief Encodes a one-indexed position as a zero-indexed wire `Position`.
[[nodiscard]] llvm::json::Value toWirePosition(const SourcePosition& position);

/// @brief Decodes a zero-indexed wire `Position` into one-indexed form.
[[nodiscard]] std::optional<SourcePosition> fromWirePosition(const llvm::json::Value& value);

/// @brief Decodes a zero-indexed wire `Range` into one-indexed form.
[[nodiscard]] std::optional<SourceRange> fromWireRange(const llvm::json::Value& value);

/// @brief Builds `TextDocumentPositionParams`.
[[nodiscard]] llvm::json::Object textDocumentPositionParams(llvm::StringRef uri, const SourcePosition& position);

/// @brief Normalizes a location-valued result.
///
/// Accepts `null`, a single `Location`, `Location[]`, or `LocationLink[]`.
/// Location links report `targetSelectionRange` (falling back to `targetRange`).
///
/// @param[in] result Response `result` member.
/// @return Locations in server order; empty for `null` or `[]`.
[[nodiscard]] llvm::Expected<std::vector<Location>> decodeLocations(const llvm::json::Value& result);

/// @brief Decodes a hover result (`MarkupContent`, `MarkedString` or `MarkedString[]`).
/// @return `std::nullopt` for a `null` result or empty contents.
[[nodiscard]] llvm::Expected<std::optional<HoverResult>> decodeHover(const llvm::json::Value& result);

/// @brief Decodes a `WorkspaceEdit` from either `changes` or `documentChanges`.
///
/// Overlapping edits inside one file are rejected as `InvalidResponse`.
[[nodiscard]] llvm::Expected<WorkspaceEditSet> decodeWorkspaceEdit(const llvm::json::Value& result);

/// @brief Decodes `DocumentSymbol[]` or `SymbolInformation[]` into a flat pre-order list.
[[nodiscard]] llvm::Expected<std::vector<SymbolEntry>> decodeDocumentSymbols(const llvm::json::Value& result);

/// @brief Decodes a `Diagnostic[]` array.
[[nodiscard]] llvm::Expected<std::vector<DiagnosticEntry>> decodeDiagnostics(const llvm::json::Value& array);

/// @brief Encodes normalized locations for output.
[[nodiscard]] llvm::json::Value toJson(const std::vector<Location>& locations);
[[nodiscard]] llvm::json::Value toJson(const WorkspaceEditSet& edits);
[[nodiscard]] llvm::json::Value toJson(const DiagnosticSet& diagnostics);
[[nodiscard]] llvm::json::Value toJson(const std::vector<SymbolEntry>& symbols);
[[nodiscard]] llvm::json::Value toJson(const std::optional<HoverResult>& hover);

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_PROTOCOL_H
