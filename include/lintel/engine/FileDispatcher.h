#pragma once

#include "lintel/project/ResourceFolderType.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lintel {

class CancellationToken;
class Client;
class Detector;
class DetectorScheduler;
class LintDriver;
class MarkupVisitor;
class Project;

// Walks one project's artifacts and feeds them to the scheduled
// detectors, in the fixed order manifest, resources, sources, classes,
// shrinker configuration. Every loop stops as soon as the run is canceled.
class FileDispatcher {
public:
    FileDispatcher(LintDriver &driver, DetectorScheduler &scheduler,
                   const CancellationToken &cancel);
    ~FileDispatcher();

    // Runs the project hooks and the file detectors for `project`, then
    // for each of its direct libraries unless only single files are
    // checked.
    void checkProject(Project &project);

    // `main` is the project being checked; it differs from `project` while
    // a library is analyzed on its behalf.
    void runFileDetectors(Project &project, Project &main);

    // Returns the visitor for resource folders of `type`, reusing the
    // previous one when the detectors applying to `type` are unchanged.
    // Null when no detector applies.
    MarkupVisitor *getResourceVisitor(ResourceFolderType type,
                                      llvm::ArrayRef<Detector *> detectors);

    // Must be called whenever the scheduled detectors change.
    void invalidateVisitorCache();

    // Concatenation of `a` and `b` keeping only the first occurrence of a
    // detector present in both.
    static std::vector<Detector *> mergeDetectors(llvm::ArrayRef<Detector *> a,
                                                  llvm::ArrayRef<Detector *> b);

private:
    struct VisitorCache {
        std::optional<ResourceFolderType> lastType;
        std::vector<Detector *> lastDetectors;
        std::unique_ptr<MarkupVisitor> visitor;
    };

    Client &client();
    bool canceled() const;

    void checkManifest(Project &project, Project &main);
    void checkResources(Project &project, Project &main);
    void checkIndividualResources(Project &project, Project &main,
                                  llvm::ArrayRef<Detector *> detectors,
                                  llvm::ArrayRef<std::string> files);
    void checkResFolder(Project &project, Project &main, llvm::StringRef res,
                        llvm::ArrayRef<Detector *> detectors);
    void checkResourceFolder(Project &project, Project &main, llvm::StringRef dir,
                             ResourceFolderType type,
                             llvm::ArrayRef<Detector *> detectors);
    void checkSources(Project &project, Project &main);
    void checkClasses(Project &project, Project &main);
    void checkJar(Project &project, Project &main, const std::string &jarFile,
                  llvm::ArrayRef<Detector *> detectors);
    void checkClassFile(llvm::ArrayRef<uint8_t> bytes, Project &project, Project &main,
                        const std::string &file, std::optional<std::string> jarFile,
                        const std::string &binDir, llvm::ArrayRef<Detector *> detectors);
    void checkProguard(Project &project, Project &main);

    LintDriver &driver_;
    DetectorScheduler &scheduler_;
    const CancellationToken &cancel_;
    VisitorCache visitorCache_;
};

} // namespace lintel
