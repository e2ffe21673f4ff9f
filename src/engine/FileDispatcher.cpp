#include "lintel/engine/FileDispatcher.h"
#include "lintel/client/Client.h"
#include "lintel/client/Parsers.h"
#include "lintel/core/Detector.h"
#include "lintel/core/FileUtils.h"
#include "lintel/core/LintConstants.h"
#include "lintel/engine/CancellationToken.h"
#include "lintel/engine/Context.h"
#include "lintel/engine/DetectorScheduler.h"
#include "lintel/engine/LintDriver.h"
#include "lintel/engine/MarkupVisitor.h"
#include "lintel/engine/SourceVisitor.h"
#include "lintel/project/Project.h"

#include <llvm/ADT/SmallPtrSet.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>

#include <archive.h>
#include <archive_entry.h>

namespace lintel {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive *a) const { archive_read_free(a); }
};

using ArchiveReader = std::unique_ptr<archive, ArchiveReadDeleter>;

// Consecutive ARCHIVE_RETRY results tolerated before a jar is given up on.
constexpr unsigned kMaxArchiveRetries = 16;

llvm::Error archiveError(archive *a) {
    const char *message = archive_error_string(a);
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   message ? message : "unknown archive error");
}

// Reads the data of the current entry. Entries of streamed archives may
// not know their size up front, so the data is read in chunks.
llvm::Expected<std::vector<uint8_t>> readEntry(archive *a) {
    std::vector<uint8_t> bytes;
    uint8_t buffer[16384];
    for (;;) {
        la_ssize_t n = archive_read_data(a, buffer, sizeof(buffer));
        if (n == 0)
            break;
        if (n < 0)
            return archiveError(a);
        bytes.insert(bytes.end(), buffer, buffer + n);
    }
    return bytes;
}

std::vector<Detector *> markupScanners(llvm::ArrayRef<Detector *> detectors) {
    std::vector<Detector *> result;
    for (Detector *detector : detectors) {
        if (detector->hasCapability(kMarkupScanner))
            result.push_back(detector);
    }
    return result;
}

} // anonymous namespace

FileDispatcher::FileDispatcher(LintDriver &driver, DetectorScheduler &scheduler,
                               const CancellationToken &cancel)
    : driver_(driver), scheduler_(scheduler), cancel_(cancel) {}

FileDispatcher::~FileDispatcher() = default;

Client &FileDispatcher::client() {
    return driver_.getClient();
}

bool FileDispatcher::canceled() const {
    return cancel_.isCanceled();
}

std::vector<Detector *> FileDispatcher::mergeDetectors(llvm::ArrayRef<Detector *> a,
                                                       llvm::ArrayRef<Detector *> b) {
    std::vector<Detector *> merged;
    merged.reserve(a.size() + b.size());
    llvm::SmallPtrSet<Detector *, 16> seen;
    for (llvm::ArrayRef<Detector *> list : {a, b}) {
        for (Detector *detector : list) {
            if (seen.insert(detector).second)
                merged.push_back(detector);
        }
    }
    return merged;
}

void FileDispatcher::invalidateVisitorCache() {
    visitorCache_ = VisitorCache();
}

MarkupVisitor *FileDispatcher::getResourceVisitor(ResourceFolderType type,
                                                  llvm::ArrayRef<Detector *> detectors) {
    if (visitorCache_.lastType == type)
        return visitorCache_.visitor.get();
    visitorCache_.lastType = type;

    std::vector<Detector *> applicable;
    for (Detector *detector : detectors) {
        if (detector->appliesTo(type))
            applicable.push_back(detector);
    }

    // Adjacent folder types often share the same detectors.
    if (applicable == visitorCache_.lastDetectors)
        return visitorCache_.visitor.get();
    visitorCache_.lastDetectors = applicable;

    MarkupParser *parser = client().getMarkupParser();
    if (applicable.empty() || !parser) {
        visitorCache_.visitor.reset();
        return nullptr;
    }

    visitorCache_.visitor = std::make_unique<MarkupVisitor>(*parser, std::move(applicable));
    return visitorCache_.visitor.get();
}

void FileDispatcher::checkProject(Project &project) {
    llvm::ArrayRef<Detector *> detectors = scheduler_.getApplicableDetectors();

    Context projectContext(driver_, project, nullptr, project.getDir().str());
    driver_.fireEvent(EventType::ScanningProject, &projectContext);

    for (Detector *detector : detectors) {
        detector->beforeCheckProject(projectContext);
        if (canceled())
            return;
    }

    runFileDetectors(project, project);
    if (canceled())
        return;

    if (!driver_.getScope().isSingleFile()) {
        for (Project *library : project.getDirectLibraries()) {
            Context libraryContext(driver_, *library, &project, project.getDir().str());
            driver_.fireEvent(EventType::ScanningLibraryProject, &libraryContext);

            for (Detector *detector : detectors) {
                detector->beforeCheckLibraryProject(libraryContext);
                if (canceled())
                    return;
            }

            runFileDetectors(*library, project);
            if (canceled())
                return;

            for (Detector *detector : detectors) {
                detector->afterCheckLibraryProject(libraryContext);
                if (canceled())
                    return;
            }
        }
    }

    for (Detector *detector : detectors) {
        detector->afterCheckProject(projectContext);
        if (canceled())
            return;
    }
}

void FileDispatcher::runFileDetectors(Project &project, Project &main) {
    checkManifest(project, main);
    if (canceled())
        return;

    checkResources(project, main);
    if (canceled())
        return;

    checkSources(project, main);
    if (canceled())
        return;

    checkClasses(project, main);
    if (canceled())
        return;

    checkProguard(project, main);
}

void FileDispatcher::checkManifest(Project &project, Project &main) {
    // Libraries contribute no manifest data of their own.
    if (project.isLibrary())
        return;
    std::optional<std::string> manifest = project.getManifestFile();
    if (!manifest)
        return;

    llvm::ArrayRef<Detector *> detectors;
    if (driver_.getScope().contains(Scope::Manifest))
        detectors = scheduler_.detectorsFor(Scope::Manifest);

    MarkupParser *parser = client().getMarkupParser();
    if (!parser) {
        // Without manifest checks the manifest data is merely missing.
        if (!detectors.empty())
            client().log("No markup parser provided: not running manifest checks");
        return;
    }

    Context context(driver_, project, &main, *manifest);
    std::unique_ptr<MarkupDocument> document = parser->parse(context);
    if (!document)
        return;
    project.readManifest(*document);

    if (detectors.empty())
        return;

    MarkupVisitor visitor(*parser, detectors.vec());
    XmlContext xmlContext(context, *document, std::nullopt);
    driver_.fireEvent(EventType::ScanningFile, &xmlContext);
    visitor.visitDocument(xmlContext);
}

void FileDispatcher::checkResources(Project &project, Project &main) {
    ScopeSet scope = driver_.getScope();
    if (!scope.contains(Scope::ResourceFile) && !scope.contains(Scope::AllResourceFiles))
        return;

    std::vector<Detector *> detectors =
        markupScanners(mergeDetectors(scheduler_.detectorsFor(Scope::ResourceFile),
                                      scheduler_.detectorsFor(Scope::AllResourceFiles)));
    if (detectors.empty())
        return;

    if (!client().getMarkupParser()) {
        client().log("No markup parser provided: not running resource checks");
        return;
    }

    if (const auto *subset = project.getSubset()) {
        checkIndividualResources(project, main, detectors, *subset);
        return;
    }

    std::string res = project.getResourceFolder();
    if (isDirectory(res))
        checkResFolder(project, main, res, detectors);
}

void FileDispatcher::checkIndividualResources(Project &project, Project &main,
                                              llvm::ArrayRef<Detector *> detectors,
                                              llvm::ArrayRef<std::string> files) {
    for (const std::string &file : files) {
        llvm::StringRef name = llvm::sys::path::filename(file);
        llvm::StringRef parent = llvm::sys::path::parent_path(file);

        if (isDirectory(file)) {
            std::optional<ResourceFolderType> type = getFolderType(name);
            bool inResources = llvm::sys::path::filename(parent) == kResFolder ||
                               pathExists(joinPath(parent, kResFolder));
            if (type && inResources) {
                checkResourceFolder(project, main, file, *type, detectors);
            } else if (name == kResFolder) {
                checkResFolder(project, main, file, detectors);
            } else {
                client().log("Unexpected folder " + file +
                             "; should be project, \"res\" folder or resource folder");
                continue;
            }
        } else if (isRegularFile(file) && isXmlFile(file)) {
            std::optional<ResourceFolderType> type =
                getFolderType(llvm::sys::path::filename(parent));
            if (!type)
                continue;
            MarkupVisitor *visitor = getResourceVisitor(*type, detectors);
            if (!visitor)
                continue;

            Context context(driver_, project, &main, file);
            driver_.fireEvent(EventType::ScanningFile, &context);
            visitor->visitFile(context, *type);
        }

        if (canceled())
            return;
    }
}

void FileDispatcher::checkResFolder(Project &project, Project &main, llvm::StringRef res,
                                    llvm::ArrayRef<Detector *> detectors) {
    // Sorted so that folders of the same type (layout, layout-land) are
    // adjacent and share one visitor.
    auto folders = listDirectory(res);
    if (!folders)
        return;

    for (const std::string &folder : *folders) {
        if (isDirectory(folder)) {
            if (auto type = getFolderType(llvm::sys::path::filename(folder)))
                checkResourceFolder(project, main, folder, *type, detectors);
        }
        if (canceled())
            return;
    }
}

void FileDispatcher::checkResourceFolder(Project &project, Project &main,
                                         llvm::StringRef dir, ResourceFolderType type,
                                         llvm::ArrayRef<Detector *> detectors) {
    auto files = listDirectory(dir);
    if (!files || files->empty())
        return;

    MarkupVisitor *visitor = getResourceVisitor(type, detectors);
    if (!visitor)
        return;

    for (const std::string &file : *files) {
        if (!isXmlFile(file) || !isRegularFile(file))
            continue;

        Context context(driver_, project, &main, file);
        driver_.fireEvent(EventType::ScanningFile, &context);
        visitor->visitFile(context, type);
        if (canceled())
            return;
    }
}

void FileDispatcher::checkSources(Project &project, Project &main) {
    ScopeSet scope = driver_.getScope();
    if (!scope.contains(Scope::SourceFile) && !scope.contains(Scope::AllSourceFiles))
        return;

    std::vector<Detector *> detectors =
        mergeDetectors(scheduler_.detectorsFor(Scope::SourceFile),
                       scheduler_.detectorsFor(Scope::AllSourceFiles));
    if (detectors.empty())
        return;

    SourceParser *parser = client().getSourceParser();
    if (!parser) {
        client().log("No source parser provided: not running source checks");
        return;
    }

    // Gather everything first, then visit with a single visitor. Source
    // checks see the whole project even when only some files were named.
    std::vector<std::string> sources;
    for (const std::string &folder : project.getSourceFolders())
        collectFiles(folder, kDotJava, sources);
    if (sources.empty())
        return;

    SourceVisitor visitor(*parser, std::move(detectors));
    for (const std::string &file : sources) {
        Context context(driver_, project, &main, file);
        driver_.fireEvent(EventType::ScanningFile, &context);
        visitor.visitFile(context);
        if (canceled())
            return;
    }
}

void FileDispatcher::checkClasses(Project &project, Project &main) {
    if (!driver_.getScope().contains(Scope::ClassFile))
        return;
    llvm::ArrayRef<Detector *> detectors = scheduler_.detectorsFor(Scope::ClassFile);
    if (detectors.empty())
        return;

    if (!client().getClassReader()) {
        client().log("No class reader provided: not running class file checks");
        return;
    }

    for (const std::string &entry : project.getClassFolders()) {
        if (hasExtension(entry, kDotJar)) {
            checkJar(project, main, entry, detectors);
            if (canceled())
                return;
            continue;
        }

        std::vector<std::string> classFiles;
        collectFiles(entry, kDotClass, classFiles);
        for (const std::string &file : classFiles) {
            auto bufOrErr = llvm::MemoryBuffer::getFile(file, /*IsText=*/false,
                                                        /*RequiresNullTerminator=*/false);
            if (!bufOrErr) {
                client().log(llvm::errorCodeToError(bufOrErr.getError()),
                             "Could not read " + file);
            } else {
                checkClassFile(llvm::arrayRefFromStringRef(bufOrErr.get()->getBuffer()),
                               project, main, file, std::nullopt, entry, detectors);
            }
            if (canceled())
                return;
        }
    }
}

void FileDispatcher::checkJar(Project &project, Project &main, const std::string &jarFile,
                              llvm::ArrayRef<Detector *> detectors) {
    ArchiveReader reader(archive_read_new());
    archive_read_support_format_zip(reader.get());

    if (archive_read_open_filename(reader.get(), jarFile.c_str(), 10240) != ARCHIVE_OK) {
        client().log(archiveError(reader.get()),
                     "Could not read jar file contents from " + jarFile);
        return;
    }

    archive_entry *entry = nullptr;
    unsigned retries = 0;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r == ARCHIVE_FATAL) {
            client().log(archiveError(reader.get()),
                         "Could not read jar file contents from " + jarFile);
            break;
        }
        if (r == ARCHIVE_RETRY) {
            if (++retries > kMaxArchiveRetries) {
                client().log(archiveError(reader.get()),
                             "Could not read jar file contents from " + jarFile);
                break;
            }
            if (canceled())
                return;
            continue;
        }
        retries = 0;

        const char *pathname = archive_entry_pathname(entry);
        llvm::StringRef name = pathname ? pathname : "";
        if (r == ARCHIVE_OK && !name.empty() && hasExtension(name, kDotClass)) {
            llvm::Expected<std::vector<uint8_t>> bytes = readEntry(reader.get());
            if (!bytes) {
                client().log(bytes.takeError(),
                             "Could not read " + name + " from " + jarFile);
            } else {
                checkClassFile(*bytes, project, main, name.str(), jarFile, jarFile,
                               detectors);
            }
        } else if (r == ARCHIVE_WARN) {
            client().log(archiveError(reader.get()),
                         "Skipping damaged entry in " + jarFile);
        }

        if (canceled())
            return;
    }
}

void FileDispatcher::checkClassFile(llvm::ArrayRef<uint8_t> bytes, Project &project,
                                    Project &main, const std::string &file,
                                    std::optional<std::string> jarFile,
                                    const std::string &binDir,
                                    llvm::ArrayRef<Detector *> detectors) {
    llvm::Expected<std::unique_ptr<ClassNode>> classNode =
        client().getClassReader()->read(bytes);
    if (!classNode) {
        client().log(classNode.takeError(), "Could not parse class " + file);
        return;
    }
    if (!*classNode)
        return;

    // Suppressed in full: no context is needed.
    if (driver_.isSuppressed(nullptr, **classNode))
        return;

    ClassContext context(driver_, project, &main, file, std::move(jarFile), binDir, bytes,
                         **classNode);
    for (Detector *detector : detectors) {
        if (detector->appliesTo(context, file)) {
            driver_.fireEvent(EventType::ScanningFile, &context);
            detector->beforeCheckFile(context);
            detector->checkClass(context, **classNode);
            detector->afterCheckFile(context);
        }
        if (canceled())
            return;
    }
}

void FileDispatcher::checkProguard(Project &project, Project &main) {
    if (&project != &main || !driver_.getScope().contains(Scope::ProguardFile))
        return;
    llvm::ArrayRef<Detector *> detectors = scheduler_.detectorsFor(Scope::ProguardFile);
    if (detectors.empty())
        return;

    std::string file = project.getProguardFile();
    if (!isRegularFile(file))
        return;

    Context context(driver_, project, &main, file);
    driver_.fireEvent(EventType::ScanningFile, &context);
    for (Detector *detector : detectors) {
        if (detector->appliesTo(context, file)) {
            detector->beforeCheckFile(context);
            detector->run(context);
            detector->afterCheckFile(context);
        }
        if (canceled())
            return;
    }
}

} // namespace lintel
