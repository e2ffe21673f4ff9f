#include "lintel/core/Scope.h"
#include "lintel/core/LintConstants.h"
#include "lintel/project/Project.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/Path.h>

#include <bitset>

namespace lintel {

std::string_view scopeName(Scope s) {
    switch (s) {
        case Scope::Manifest:         return "manifest";
        case Scope::ResourceFile:     return "resource-file";
        case Scope::AllResourceFiles: return "all-resource-files";
        case Scope::SourceFile:       return "source-file";
        case Scope::AllSourceFiles:   return "all-source-files";
        case Scope::ClassFile:        return "class-file";
        case Scope::ProguardFile:     return "proguard-file";
    }
    return "unknown";
}

std::optional<Scope> parseScope(std::string_view name) {
    for (Scope s : kAllScopes) {
        if (scopeName(s) == name)
            return s;
    }
    return std::nullopt;
}

unsigned ScopeSet::size() const {
    return static_cast<unsigned>(std::bitset<8>(bits_).count());
}

bool ScopeSet::isSingleFile() const {
    unsigned n = size();
    if (n == 2) {
        // A single source file is checked together with its class files.
        return contains(Scope::SourceFile) && contains(Scope::ClassFile);
    }
    return n == 1 &&
           (contains(Scope::SourceFile) || contains(Scope::ClassFile) ||
            contains(Scope::ResourceFile) || contains(Scope::ProguardFile) ||
            contains(Scope::Manifest));
}

ScopeSet inferScope(llvm::ArrayRef<Project *> projects) {
    ScopeSet scope;
    for (const Project *project : projects) {
        const auto *subset = project->getSubset();
        if (!subset) {
            // A whole project was named: check everything.
            return ScopeSet::all();
        }

        for (const auto &file : *subset) {
            llvm::StringRef name = llvm::sys::path::filename(file);
            llvm::StringRef parentName =
                llvm::sys::path::filename(llvm::sys::path::parent_path(file));
            if (name == kManifestFile) {
                scope.insert(Scope::Manifest);
            } else if (name.endswith(kDotXml)) {
                scope.insert(Scope::ResourceFile);
            } else if (name == kProguardConfig) {
                scope.insert(Scope::ProguardFile);
            } else if (name == kResFolder || parentName == kResFolder) {
                scope.insert(Scope::AllResourceFiles);
                scope.insert(Scope::ResourceFile);
            } else if (name.endswith(kDotJava)) {
                scope.insert(Scope::SourceFile);
            } else if (name.endswith(kDotClass)) {
                scope.insert(Scope::ClassFile);
            }
        }
    }
    return scope;
}

std::optional<ScopeSet> parseScopeList(llvm::StringRef list) {
    llvm::SmallVector<llvm::StringRef, 8> names;
    list.split(names, ',', /*MaxSplit=*/-1, /*KeepEmpty=*/false);

    ScopeSet scope;
    for (llvm::StringRef name : names) {
        auto s = parseScope(name.trim());
        if (!s)
            return std::nullopt;
        scope.insert(*s);
    }
    return scope;
}

} // namespace lintel
