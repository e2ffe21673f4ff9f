#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/MapVector.h>
#include <llvm/ADT/StringRef.h>

#include <map>
#include <string>
#include <vector>

namespace lintel {

class CancellationToken;
class Client;
class Project;

// Maps the paths given on the command line to the root projects to check.
class ProjectResolver {
public:
    ProjectResolver(Client &client, const CancellationToken &cancel)
        : client_(client), cancel_(cancel) {}

    // Each returned project is a root: projects that are libraries of
    // another resolved project are analyzed through it instead. Paths that
    // name something inside a project (rather than the project directory)
    // become that project's explicit file subset. Returns nothing when
    // canceled.
    std::vector<Project *> resolve(llvm::ArrayRef<std::string> paths);

    static bool isProjectDir(llvm::StringRef dir);

private:
    using FileProjectMap = llvm::MapVector<std::string, Project *, std::map<std::string, unsigned>>;

    void registerProjectFile(FileProjectMap &fileToProject, llvm::StringRef file,
                             llvm::StringRef projectDir, llvm::StringRef rootDir);
    void addProjects(llvm::StringRef dir, FileProjectMap &fileToProject,
                     llvm::StringRef rootDir);

    Client &client_;
    const CancellationToken &cancel_;
};

} // namespace lintel
