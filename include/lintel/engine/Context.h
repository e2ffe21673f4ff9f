#pragma once

#include "lintel/core/Issue.h"
#include "lintel/core/Location.h"
#include "lintel/core/Scope.h"
#include "lintel/project/ResourceFolderType.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ErrorOr.h>

#include <any>
#include <cstdint>
#include <optional>
#include <string>

namespace lintel {

class Configuration;
class Detector;
class LintDriver;
class Project;
class SourceNode;
struct ClassNode;
struct MarkupDocument;

// Everything a detector hook needs to know about the unit under analysis.
// A fresh context is built for every project, manifest, resource, source,
// class and configuration file visited and is not modified afterwards.
class Context {
public:
    Context(LintDriver &driver, Project &project, Project *main, std::string file);
    virtual ~Context() = default;

    LintDriver &getDriver() const { return *driver_; }
    Project &getProject() const { return *project_; }
    // The project the user asked to check; differs from getProject() while
    // a library is analyzed on its behalf.
    Project &getMainProject() const { return main_ ? *main_ : *project_; }
    bool isLibraryScan() const { return main_ && main_ != project_; }
    const std::string &getFile() const { return file_; }

    Configuration &getConfiguration() const;
    bool isEnabled(const Issue &issue) const;
    ScopeSet getScope() const;
    int getPhase() const;

    void report(const Issue &issue, const std::optional<Location> &location,
                llvm::StringRef message, const std::any &data = {}) const;
    void requestRepeat(Detector &detector,
                       std::optional<ScopeSet> scope = std::nullopt) const;

    llvm::ErrorOr<std::string> getContents() const;

private:
    LintDriver *driver_;
    Project *project_;
    Project *main_;
    std::string file_;
};

class XmlContext : public Context {
public:
    XmlContext(const Context &base, const MarkupDocument &document,
               std::optional<ResourceFolderType> folderType)
        : Context(base), document_(&document), folderType_(folderType) {}

    const MarkupDocument &getDocument() const { return *document_; }
    // Unset for the manifest.
    std::optional<ResourceFolderType> getResourceFolderType() const { return folderType_; }

private:
    const MarkupDocument *document_;
    std::optional<ResourceFolderType> folderType_;
};

class SourceContext : public Context {
public:
    SourceContext(const Context &base, const SourceNode &unit)
        : Context(base), unit_(&unit) {}

    const SourceNode &getCompilationUnit() const { return *unit_; }

    // Whether `issue` is suppressed at `node` or any enclosing declaration.
    bool isSuppressed(const Issue &issue, const SourceNode &node) const;

private:
    const SourceNode *unit_;
};

class ClassContext : public Context {
public:
    ClassContext(LintDriver &driver, Project &project, Project *main,
                 std::string file, std::optional<std::string> jarFile,
                 std::string binDir, llvm::ArrayRef<uint8_t> bytes,
                 const ClassNode &classNode);

    // Archive holding the class, when it was read from one.
    const std::optional<std::string> &getJarFile() const { return jarFile_; }
    const std::string &getBinDir() const { return binDir_; }
    llvm::ArrayRef<uint8_t> getBytecode() const { return bytes_; }
    const ClassNode &getClassNode() const { return *classNode_; }

private:
    std::optional<std::string> jarFile_;
    std::string binDir_;
    llvm::ArrayRef<uint8_t> bytes_;
    const ClassNode *classNode_;
};

} // namespace lintel
