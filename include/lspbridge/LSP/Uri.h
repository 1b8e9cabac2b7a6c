//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// `file://` URI conversion and language identifiers for documents.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_URI_H
#define LSPBRIDGE_LSP_URI_H

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <string>

namespace lspbridge::lsp
{

/// @brief Converts a filesystem path to a canonical `file://` URI.
///
/// Relative paths are made absolute against the current directory and `.`/`..`
/// segments are removed. Characters outside the RFC 3986 unreserved set (other
/// than `/`) are percent-encoded.
///
/// @param[in] path Filesystem path.
/// @return `file://` URI.
[[nodiscard]] std::string pathToUri(llvm::StringRef path);

/// @brief Converts a `file://` URI back to a filesystem path.
/// @param[in] uri Document URI.
/// @return Decoded path, or `std::nullopt` for non-file or malformed URIs.
[[nodiscard]] std::optional<std::string> uriToPath(llvm::StringRef uri);

/// @brief Returns the LSP language identifier for a file path.
/// @param[in] path File path; only the extension and file name are inspected.
/// @return Language id such as `cpp`, or `plaintext` when unknown.
[[nodiscard]] llvm::StringRef languageIdForPath(llvm::StringRef path);

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_URI_H
