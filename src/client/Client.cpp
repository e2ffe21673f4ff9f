#include "lintel/client/Client.h"
#include "lintel/core/FileUtils.h"
#include "lintel/core/LintConstants.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>

#include <algorithm>
#include <utility>

namespace lintel {

Client::~Client() = default;

Configuration &Client::getConfiguration(const Project &project) {
    auto &slot = configurations_[&project];
    if (!slot) {
        std::string path = joinPath(project.getDir(), kConfigFile);
        if (isRegularFile(path))
            slot = std::make_unique<YamlConfiguration>(YamlConfiguration::loadFromFile(path));
        else
            slot = std::make_unique<YamlConfiguration>(YamlConfiguration::defaults());
    }
    return *slot;
}

llvm::ErrorOr<std::string> Client::readFile(llvm::StringRef path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr)
        return bufOrErr.getError();
    return bufOrErr.get()->getBuffer().str();
}

std::vector<std::string> Client::getSourceFolders(const Project &project) {
    std::vector<std::string> folders;
    std::string src = joinPath(project.getDir(), kSrcFolder);
    if (isDirectory(src))
        folders.push_back(std::move(src));
    return folders;
}

std::vector<std::string> Client::getClassFolders(const Project &project) {
    std::vector<std::string> folders;
    std::string classes = joinPath(project.getDir(), kBinClassesFolder);
    if (isDirectory(classes))
        folders.push_back(std::move(classes));

    std::string libs = joinPath(project.getDir(), kLibsFolder);
    if (auto entries = listDirectory(libs)) {
        for (auto &entry : *entries) {
            if (isRegularFile(entry) && hasExtension(entry, kDotJar))
                folders.push_back(std::move(entry));
        }
    }
    return folders;
}

Project &Client::getProject(llvm::StringRef dir, llvm::StringRef referenceDir) {
    std::string key = makeAbsolute(dir);
    auto it = projects_.find(key);
    if (it != projects_.end())
        return *it->second;

    auto inserted = projects_.emplace(key, createProject(key, referenceDir));
    Project &project = *inserted.first->second;
    // Cached before its libraries are resolved so that reference cycles end
    // at the already registered instance.
    readProjectProperties(project);
    return project;
}

std::unique_ptr<Project> Client::createProject(llvm::StringRef dir,
                                               llvm::StringRef referenceDir) {
    return std::make_unique<Project>(*this, dir.str(), referenceDir.str());
}

void Client::readProjectProperties(Project &project) {
    std::string path = joinPath(project.getDir(), kProjectProperties);
    if (!isRegularFile(path))
        return;

    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        log(llvm::errorCodeToError(bufOrErr.getError()),
            "Could not read " + path);
        return;
    }

    std::vector<std::pair<unsigned, std::string>> references;
    llvm::SmallVector<llvm::StringRef, 32> lines;
    bufOrErr.get()->getBuffer().split(lines, '\n', /*MaxSplit=*/-1,
                                      /*KeepEmpty=*/false);
    for (llvm::StringRef line : lines) {
        line = line.trim();
        if (line.empty() || line.startswith("#"))
            continue;

        auto [key, value] = line.split('=');
        key = key.trim();
        value = value.trim();

        if (key == kLibraryProperty) {
            project.setLibrary(value.equals_insensitive("true"));
        } else if (key.consume_front(kLibraryReferencePrefix)) {
            unsigned index = 0;
            if (key.getAsInteger(10, index))
                continue;
            references.emplace_back(index, value.str());
        }
    }

    std::sort(references.begin(), references.end());
    for (const auto &[index, relative] : references) {
        std::string libraryDir = makeAbsolute(joinPath(project.getDir(), relative));
        if (!isDirectory(libraryDir)) {
            log(llvm::Twine("Library project ") + relative + " referenced from " +
                project.getDir() + " does not exist");
            continue;
        }
        project.addDirectLibrary(getProject(libraryDir, project.getReferenceDir()));
    }
}

} // namespace lintel
