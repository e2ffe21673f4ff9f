#include "lintel/engine/ProjectResolver.h"
#include "lintel/client/Client.h"
#include "lintel/core/FileUtils.h"
#include "lintel/core/LintConstants.h"
#include "lintel/engine/CancellationToken.h"
#include "lintel/project/Project.h"

#include <llvm/ADT/SetVector.h>
#include <llvm/ADT/SmallPtrSet.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Path.h>

#include <cassert>
#include <optional>

namespace lintel {

namespace {

// The filesystem root is too broad to be useful as a reference directory.
bool isFilesystemRoot(llvm::StringRef path) {
    return llvm::sys::path::parent_path(path).empty() ||
           path == llvm::sys::path::root_path(path);
}

#ifndef NDEBUG
void assertUniqueDirectories(llvm::ArrayRef<Project *> roots) {
    llvm::SmallPtrSet<const Project *, 16> projects;
    for (const Project *project : roots) {
        projects.insert(project);
        for (const Project *library : project->getAllLibraries())
            projects.insert(library);
    }

    llvm::StringSet<> dirs;
    for (const Project *project : projects) {
        bool inserted = dirs.insert(project->getDir()).second;
        assert(inserted && "two project instances share a directory");
        (void)inserted;
    }
}
#endif

} // anonymous namespace

bool ProjectResolver::isProjectDir(llvm::StringRef dir) {
    return pathExists(joinPath(dir, kManifestFile));
}

void ProjectResolver::registerProjectFile(FileProjectMap &fileToProject,
                                          llvm::StringRef file,
                                          llvm::StringRef projectDir,
                                          llvm::StringRef rootDir) {
    fileToProject[file.str()] = &client_.getProject(projectDir, rootDir);
}

void ProjectResolver::addProjects(llvm::StringRef dir, FileProjectMap &fileToProject,
                                  llvm::StringRef rootDir) {
    if (cancel_.isCanceled())
        return;

    if (isProjectDir(dir)) {
        registerProjectFile(fileToProject, dir, dir, rootDir);
        return;
    }

    auto entries = listDirectory(dir);
    if (!entries)
        return;
    for (const std::string &entry : *entries) {
        if (isDirectory(entry))
            addProjects(entry, fileToProject, rootDir);
    }
}

std::vector<Project *> ProjectResolver::resolve(llvm::ArrayRef<std::string> paths) {
    FileProjectMap fileToProject;

    std::vector<std::string> files(paths.begin(), paths.end());
    std::optional<std::string> sharedRoot;
    if (files.size() > 1) {
        for (std::string &file : files)
            file = makeAbsolute(file);
        sharedRoot = commonParent(files);
        if (sharedRoot && isFilesystemRoot(*sharedRoot))
            sharedRoot.reset();
    }

    for (const std::string &file : files) {
        if (isDirectory(file)) {
            std::string rootDir;
            if (sharedRoot) {
                rootDir = *sharedRoot;
            } else {
                rootDir = file;
                if (files.size() > 1) {
                    llvm::StringRef parent = llvm::sys::path::parent_path(file);
                    if (!parent.empty())
                        rootDir = parent.str();
                }
            }

            // A directory is either a project, a folder directly inside one
            // (such as src/ or res/), or a tree of projects to search.
            if (isProjectDir(file)) {
                registerProjectFile(fileToProject, file, file, rootDir);
            } else {
                std::string absolute = makeAbsolute(file);
                llvm::StringRef parent = llvm::sys::path::parent_path(absolute);
                llvm::StringRef grandParent = llvm::sys::path::parent_path(parent);
                if (!parent.empty() && isProjectDir(parent)) {
                    registerProjectFile(fileToProject, file, parent, parent);
                } else if (!grandParent.empty() && isProjectDir(grandParent)) {
                    registerProjectFile(fileToProject, file, grandParent, grandParent);
                } else {
                    addProjects(file, fileToProject, rootDir);
                }
            }
        } else {
            // A file: the nearest enclosing project owns it.
            std::string absolute = makeAbsolute(file);
            for (llvm::StringRef parent = llvm::sys::path::parent_path(absolute);
                 !parent.empty(); parent = llvm::sys::path::parent_path(parent)) {
                if (isProjectDir(parent)) {
                    registerProjectFile(fileToProject, file, parent, parent);
                    break;
                }
            }
        }

        if (cancel_.isCanceled())
            return {};
    }

    if (cancel_.isCanceled())
        return {};

    for (auto &[file, project] : fileToProject) {
        if (makeAbsolute(file) == project->getDir())
            continue;
        if (isDirectory(file) && canonicalPath(file) == canonicalPath(project->getDir()))
            continue;
        project->addFile(makeAbsolute(file));
    }

    // Libraries of another resolved project are checked through that
    // project rather than on their own.
    llvm::SetVector<Project *> roots;
    for (auto &entry : fileToProject)
        roots.insert(entry.second);
    for (auto &entry : fileToProject) {
        for (Project *library : entry.second->getAllLibraries())
            roots.remove(library);
    }

    std::vector<Project *> result(roots.begin(), roots.end());
#ifndef NDEBUG
    assertUniqueDirectories(result);
#endif
    return result;
}

} // namespace lintel
