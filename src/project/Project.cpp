#include "lintel/project/Project.h"
#include "lintel/client/Client.h"
#include "lintel/core/FileUtils.h"
#include "lintel/core/LintConstants.h"
#include "lintel/model/MarkupDocument.h"

#include <llvm/ADT/SmallPtrSet.h>
#include <llvm/Support/Path.h>

#include <algorithm>

namespace lintel {

namespace {

void collectLibraries(const Project &project,
                      llvm::SmallPtrSetImpl<const Project *> &seen,
                      std::vector<Project *> &out) {
    for (Project *library : project.getDirectLibraries()) {
        if (!seen.insert(library).second)
            continue;
        out.push_back(library);
        collectLibraries(*library, seen, out);
    }
}

} // anonymous namespace

Project::Project(Client &client, std::string dir, std::string referenceDir)
    : client_(client), dir_(std::move(dir)),
      referenceDir_(std::move(referenceDir)) {}

llvm::StringRef Project::getName() const {
    return llvm::sys::path::filename(dir_);
}

std::optional<std::string> Project::getManifestFile() const {
    std::string manifest = joinPath(dir_, kManifestFile);
    if (!isRegularFile(manifest))
        return std::nullopt;
    return manifest;
}

std::string Project::getResourceFolder() const {
    return joinPath(dir_, kResFolder);
}

std::string Project::getProguardFile() const {
    return joinPath(dir_, kProguardConfig);
}

const std::vector<std::string> &Project::getSourceFolders() const {
    if (!sourceFolders_)
        sourceFolders_ = client_.getSourceFolders(*this);
    return *sourceFolders_;
}

const std::vector<std::string> &Project::getClassFolders() const {
    if (!classFolders_)
        classFolders_ = client_.getClassFolders(*this);
    return *classFolders_;
}

void Project::addFile(std::string file) {
    if (!subset_)
        subset_.emplace();
    if (std::find(subset_->begin(), subset_->end(), file) == subset_->end())
        subset_->push_back(std::move(file));
}

Configuration &Project::getConfiguration() const {
    if (!configuration_)
        configuration_ = &client_.getConfiguration(*this);
    return *configuration_;
}

void Project::addDirectLibrary(Project &library) {
    if (&library == this)
        return;
    if (std::find(directLibraries_.begin(), directLibraries_.end(), &library) ==
        directLibraries_.end())
        directLibraries_.push_back(&library);
}

std::vector<Project *> Project::getAllLibraries() const {
    std::vector<Project *> all;
    llvm::SmallPtrSet<const Project *, 8> seen;
    seen.insert(this);
    collectLibraries(*this, seen, all);
    return all;
}

void Project::readManifest(const MarkupDocument &document) {
    if (!document.root)
        return;

    package_ = document.root->getAttribute(kManifestPackageAttr).str();
    for (const auto &child : document.root->children()) {
        if (child->getTagName() != kUsesSdkTag)
            continue;
        int minSdk = 0;
        if (!child->getAttribute(kMinSdkVersionAttr).getAsInteger(10, minSdk))
            minSdk_ = minSdk;
    }
}

} // namespace lintel
