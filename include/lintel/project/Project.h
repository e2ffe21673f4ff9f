#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

#include <optional>
#include <string>
#include <vector>

namespace lintel {

class Client;
class Configuration;
struct MarkupDocument;

// A project unit: a directory holding a manifest, resources, sources and
// compiled output. Instances are created and cached by Client::getProject,
// one per directory.
class Project {
public:
    Project(Client &client, std::string dir, std::string referenceDir);

    Project(const Project &) = delete;
    Project &operator=(const Project &) = delete;

    llvm::StringRef getDir() const { return dir_; }
    llvm::StringRef getReferenceDir() const { return referenceDir_; }
    llvm::StringRef getName() const;

    // Path of the manifest, when the project has one.
    std::optional<std::string> getManifestFile() const;
    std::string getResourceFolder() const;
    std::string getProguardFile() const;

    const std::vector<std::string> &getSourceFolders() const;
    // Directories or .jar archives holding compiled classes.
    const std::vector<std::string> &getClassFolders() const;

    // Files the user explicitly asked to check, or nullptr when the whole
    // project is checked.
    const std::vector<std::string> *getSubset() const {
        return subset_ ? &*subset_ : nullptr;
    }
    void addFile(std::string file);

    Configuration &getConfiguration() const;

    bool isLibrary() const { return library_; }
    void setLibrary(bool library) { library_ = library; }

    llvm::ArrayRef<Project *> getDirectLibraries() const { return directLibraries_; }
    void addDirectLibrary(Project &library);

    // Transitive closure of the library dependencies, each project once,
    // in depth-first order.
    std::vector<Project *> getAllLibraries() const;

    // Records data derived from the parsed manifest.
    void readManifest(const MarkupDocument &document);
    llvm::StringRef getPackage() const { return package_; }
    int getMinSdk() const { return minSdk_; }

private:
    Client &client_;
    std::string dir_;
    std::string referenceDir_;
    std::optional<std::vector<std::string>> subset_;
    mutable std::optional<std::vector<std::string>> sourceFolders_;
    mutable std::optional<std::vector<std::string>> classFolders_;
    mutable Configuration *configuration_ = nullptr;
    bool library_ = false;
    std::vector<Project *> directLibraries_;
    std::string package_;
    int minSdk_ = -1;
};

} // namespace lintel
