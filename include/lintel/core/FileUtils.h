#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ErrorOr.h>

#include <optional>
#include <string>
#include <vector>

namespace lintel {

bool isXmlFile(llvm::StringRef path);

// Case-insensitive suffix test used for extension matching.
bool hasExtension(llvm::StringRef path, llvm::StringRef extension);

bool isDirectory(llvm::StringRef path);
bool isRegularFile(llvm::StringRef path);
bool pathExists(llvm::StringRef path);

std::string joinPath(llvm::StringRef dir, llvm::StringRef name);
std::string makeAbsolute(llvm::StringRef path);

// Canonical form of `path`, or `path` itself when it cannot be resolved.
std::string canonicalPath(llvm::StringRef path);

// Nearest directory containing every path, or std::nullopt when the
// paths share nothing.
std::optional<std::string> commonParent(llvm::ArrayRef<std::string> paths);

// Immediate children of `dir`, sorted by name.
llvm::ErrorOr<std::vector<std::string>> listDirectory(llvm::StringRef dir);

// Appends every regular file below `dir` whose name ends with `extension`.
// Directory listings are visited in sorted order.
void collectFiles(llvm::StringRef dir, llvm::StringRef extension,
                  std::vector<std::string> &out);

} // namespace lintel
