#include "lintel/core/FileUtils.h"
#include "lintel/core/LintConstants.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

#include <algorithm>

namespace lintel {

bool hasExtension(llvm::StringRef path, llvm::StringRef extension) {
    return path.endswith_insensitive(extension);
}

bool isXmlFile(llvm::StringRef path) {
    return hasExtension(path, kDotXml);
}

bool isDirectory(llvm::StringRef path) {
    return llvm::sys::fs::is_directory(path);
}

bool isRegularFile(llvm::StringRef path) {
    return llvm::sys::fs::is_regular_file(path);
}

bool pathExists(llvm::StringRef path) {
    return llvm::sys::fs::exists(path);
}

std::string joinPath(llvm::StringRef dir, llvm::StringRef name) {
    llvm::SmallString<256> joined(dir);
    llvm::sys::path::append(joined, name);
    return std::string(joined);
}

std::string makeAbsolute(llvm::StringRef path) {
    llvm::SmallString<256> abs(path);
    if (llvm::sys::fs::make_absolute(abs))
        return path.str();
    llvm::sys::path::remove_dots(abs, /*remove_dot_dot=*/true);
    return std::string(abs);
}

std::string canonicalPath(llvm::StringRef path) {
    llvm::SmallString<256> real;
    if (llvm::sys::fs::real_path(path, real))
        return path.str();
    return std::string(real);
}

std::optional<std::string> commonParent(llvm::ArrayRef<std::string> paths) {
    if (paths.empty())
        return std::nullopt;

    llvm::SmallString<256> common(paths.front());
    for (const auto &path : paths.drop_front()) {
        llvm::StringRef candidate = common;
        // Walk `common` upwards until it is a component-wise prefix of `path`.
        while (!candidate.empty()) {
            auto it = llvm::sys::path::begin(candidate);
            auto end = llvm::sys::path::end(candidate);
            auto pit = llvm::sys::path::begin(path);
            auto pend = llvm::sys::path::end(path);
            bool prefix = true;
            for (; it != end; ++it, ++pit) {
                if (pit == pend || *it != *pit) {
                    prefix = false;
                    break;
                }
            }
            if (prefix)
                break;
            candidate = llvm::sys::path::parent_path(candidate);
        }
        if (candidate.empty())
            return std::nullopt;
        common = candidate.str();
    }

    return std::string(common);
}

llvm::ErrorOr<std::vector<std::string>> listDirectory(llvm::StringRef dir) {
    std::vector<std::string> entries;
    std::error_code EC;
    for (llvm::sys::fs::directory_iterator it(dir, EC), end; it != end && !EC;
         it.increment(EC)) {
        entries.push_back(it->path());
    }
    if (EC)
        return EC;

    std::sort(entries.begin(), entries.end());
    return entries;
}

void collectFiles(llvm::StringRef dir, llvm::StringRef extension,
                  std::vector<std::string> &out) {
    auto entries = listDirectory(dir);
    if (!entries)
        return;

    for (const auto &entry : *entries) {
        if (isRegularFile(entry) && hasExtension(entry, extension)) {
            out.push_back(entry);
        } else if (isDirectory(entry)) {
            collectFiles(entry, extension, out);
        }
    }
}

} // namespace lintel
