#pragma once

#include "lintel/core/Configuration.h"
#include "lintel/core/Issue.h"
#include "lintel/core/Location.h"
#include "lintel/project/Project.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/ErrorOr.h>

#include <any>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lintel {

class ClassReader;
class Context;
class MarkupParser;
class SourceParser;

// The tool embedding the analyzer (a CLI, an IDE, a test harness). It
// receives findings and diagnostics and supplies parsers and the project
// model.
class Client {
public:
    virtual ~Client();

    virtual void report(const Context &context, const Issue &issue,
                        const std::optional<Location> &location,
                        llvm::StringRef message, const std::any &data) = 0;

    // Non-fatal diagnostics. `error` may be success when there is no
    // underlying failure to attach.
    virtual void log(llvm::Error error, const llvm::Twine &message) = 0;
    void log(const llvm::Twine &message) { log(llvm::Error::success(), message); }

    virtual Configuration &getConfiguration(const Project &project);
    virtual llvm::ErrorOr<std::string> readFile(llvm::StringRef path);

    virtual std::vector<std::string> getSourceFolders(const Project &project);
    virtual std::vector<std::string> getClassFolders(const Project &project);

    virtual MarkupParser *getMarkupParser() { return nullptr; }
    virtual SourceParser *getSourceParser() { return nullptr; }
    virtual ClassReader *getClassReader() { return nullptr; }

    // Returns the project rooted at `dir`, creating it on first use. The
    // same directory always yields the same instance.
    virtual Project &getProject(llvm::StringRef dir, llvm::StringRef referenceDir);

protected:
    virtual std::unique_ptr<Project> createProject(llvm::StringRef dir,
                                                   llvm::StringRef referenceDir);

private:
    // Applies project.properties: the library flag and library references.
    void readProjectProperties(Project &project);

    std::map<std::string, std::unique_ptr<Project>, std::less<>> projects_;
    std::map<const Project *, std::unique_ptr<Configuration>> configurations_;
};

} // namespace lintel
