//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `file://` URI conversion and language-id detection.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Uri.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <string>

namespace lspbridge::lsp
{
namespace
{

constexpr llvm::StringLiteral FileScheme = "file://";

bool isUnreserved(const char ch)
{
    return llvm::isAlnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

}  // namespace

std::string pathToUri(const llvm::StringRef path)
{
    llvm::SmallString<256> absolute(path);
    if (!llvm::sys::path::is_absolute(absolute))
    {
        // Falls back to the relative spelling when the working directory is unavailable.
        if (const std::error_code ec = llvm::sys::fs::make_absolute(absolute))
        {
            absolute.assign(path);
        }
    }
    llvm::sys::path::remove_dots(absolute, /*remove_dot_dot=*/true);
    llvm::sys::path::native(absolute, llvm::sys::path::Style::posix);

    std::string uri(FileScheme);
    if (!absolute.startswith("/"))
    {
        uri.push_back('/');
    }
    for (const char ch : absolute)
    {
        if (isUnreserved(ch) || ch == '/')
        {
            uri.push_back(ch);
            continue;
        }
        uri.push_back('%');
        uri.push_back(llvm::hexdigit(static_cast<unsigned char>(ch) >> 4U, /*LowerCase=*/false));
        uri.push_back(llvm::hexdigit(static_cast<unsigned char>(ch) & 0x0FU, /*LowerCase=*/false));
    }
    return uri;
}

std::optional<std::string> uriToPath(llvm::StringRef uri)
{
    if (!uri.consume_front(FileScheme))
    {
        return std::nullopt;
    }
    // `file://localhost/path` names the same file as `file:///path`.
    uri.consume_front("localhost");
    if (!uri.startswith("/"))
    {
        return std::nullopt;
    }

    std::string path;
    path.reserve(uri.size());
    for (std::size_t index = 0; index < uri.size(); ++index)
    {
        const char ch = uri[index];
        if (ch != '%')
        {
            path.push_back(ch);
            continue;
        }
        if (index + 2 >= uri.size() || !llvm::isHexDigit(uri[index + 1]) || !llvm::isHexDigit(uri[index + 2]))
        {
            return std::nullopt;
        }
        path.push_back(static_cast<char>((llvm::hexDigitValue(uri[index + 1]) << 4U) |
                                         llvm::hexDigitValue(uri[index + 2])));
        index += 2;
    }
    return path;
}

llvm::StringRef languageIdForPath(const llvm::StringRef path)
{
    const llvm::StringRef fileName = llvm::sys::path::filename(path);
    if (fileName == "Makefile" || fileName == "makefile" || fileName == "GNUmakefile")
    {
        return "makefile";
    }
    if (fileName == "Dockerfile")
    {
        return "dockerfile";
    }
    if (fileName == "CMakeLists.txt")
    {
        return "cmake";
    }

    const std::string extension = llvm::sys::path::extension(path).lower();
    return llvm::StringSwitch<llvm::StringRef>(extension)
        .Cases(".c", ".h", "c")
        .Cases(".cc", ".cpp", ".cxx", ".c++", "cpp")
        .Cases(".hh", ".hpp", ".hxx", ".h++", ".inl", ".ipp", "cpp")
        .Case(".cs", "csharp")
        .Case(".go", "go")
        .Case(".rs", "rust")
        .Case(".py", "python")
        .Case(".pyi", "python")
        .Case(".js", "javascript")
        .Cases(".mjs", ".cjs", "javascript")
        .Case(".jsx", "javascriptreact")
        .Case(".ts", "typescript")
        .Cases(".mts", ".cts", "typescript")
        .Case(".tsx", "typescriptreact")
        .Case(".java", "java")
        .Case(".kt", "kotlin")
        .Case(".swift", "swift")
        .Cases(".m", ".mm", "objective-c")
        .Case(".rb", "ruby")
        .Case(".php", "php")
        .Case(".lua", "lua")
        .Case(".zig", "zig")
        .Case(".dart", "dart")
        .Cases(".sh", ".bash", "shellscript")
        .Case(".json", "json")
        .Cases(".yaml", ".yml", "yaml")
        .Case(".toml", "toml")
        .Cases(".md", ".markdown", "markdown")
        .Cases(".html", ".htm", "html")
        .Case(".css", "css")
        .Case(".scss", "scss")
        .Case(".xml", "xml")
        .Case(".sql", "sql")
        .Case(".cmake", "cmake")
        .Default("plaintext");
}

}  // namespace lspbridge::lsp
