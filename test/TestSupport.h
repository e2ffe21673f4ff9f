#pragma once

#include "lintel/client/Client.h"
#include "lintel/client/Parsers.h"
#include "lintel/core/Configuration.h"
#include "lintel/core/Detector.h"
#include "lintel/core/FileUtils.h"
#include "lintel/core/IssueRegistry.h"
#include "lintel/engine/Context.h"
#include "lintel/engine/LintDriver.h"
#include "lintel/engine/LintListener.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace lintel::test {

// Scratch directory removed when the test ends. Paths are canonical so
// they compare equal to what the resolver computes.
class TempTree {
public:
    TempTree() {
        llvm::SmallString<256> dir;
        std::error_code EC = llvm::sys::fs::createUniqueDirectory("lintel-test", dir);
        EXPECT_FALSE(EC) << EC.message();
        root_ = canonicalPath(dir);
    }

    ~TempTree() { llvm::sys::fs::remove_directories(root_); }

    TempTree(const TempTree &) = delete;
    TempTree &operator=(const TempTree &) = delete;

    const std::string &root() const { return root_; }

    std::string path(llvm::StringRef relative) const {
        return relative.empty() ? root_ : joinPath(root_, relative);
    }

    std::string mkdir(llvm::StringRef relative) const {
        std::string dir = path(relative);
        std::error_code EC = llvm::sys::fs::create_directories(dir);
        EXPECT_FALSE(EC) << EC.message();
        return dir;
    }

    std::string write(llvm::StringRef relative, llvm::StringRef contents) const {
        std::string file = path(relative);
        llvm::sys::fs::create_directories(llvm::sys::path::parent_path(file));
        std::error_code EC;
        llvm::raw_fd_ostream os(file, EC);
        EXPECT_FALSE(EC) << EC.message();
        os << contents;
        return file;
    }

    // A directory holding a manifest is a project.
    std::string makeProject(llvm::StringRef relative,
                            llvm::StringRef package = "com.example") const {
        write((relative + "/AndroidManifest.xml").str(),
              "<manifest package=\"" + package.str() + "\">\n"
              "  <uses-sdk android:minSdkVersion=\"14\"/>\n"
              "</manifest>\n");
        return path(relative);
    }

private:
    std::string root_;
};

// Markup parser for test files. The first start tag becomes the root and
// every later start tag a child of it; attributes are name="value" pairs.
// A file containing "<broken" is rejected.
class FakeMarkupParser : public MarkupParser {
public:
    std::unique_ptr<MarkupDocument> parse(const Context &context) override {
        parsed.push_back(context.getFile());
        auto contents = context.getContents();
        if (!contents)
            return nullptr;
        llvm::StringRef text = *contents;
        if (text.contains("<broken"))
            return nullptr;

        auto document = std::make_unique<MarkupDocument>();
        document->path = context.getFile();

        size_t pos = 0;
        while ((pos = text.find('<', pos)) != llvm::StringRef::npos) {
            ++pos;
            if (pos >= text.size() || text[pos] == '/' || text[pos] == '?' || text[pos] == '!')
                continue;
            size_t end = text.find('>', pos);
            llvm::StringRef tag = text.slice(pos, end).rtrim("/ ");
            size_t space = tag.find_first_of(" \t\r\n");
            llvm::StringRef name = tag.take_front(space);
            llvm::StringRef rest =
                space == llvm::StringRef::npos ? llvm::StringRef() : tag.drop_front(space);

            MarkupElement *element;
            if (!document->root) {
                document->root = std::make_unique<MarkupElement>(name.str());
                element = document->root.get();
            } else {
                element = &document->root->appendChild(name.str());
            }

            rest = rest.trim();
            while (!rest.empty()) {
                auto [attrName, afterName] = rest.split("=\"");
                auto [value, afterValue] = afterName.split('"');
                element->setAttribute(attrName.trim().str(), value.str());
                rest = afterValue.trim();
            }
        }
        return document;
    }

    std::vector<std::string> parsed;
};

// Produces a compilation unit with one class declaration named after the
// file. Files containing "broken" are rejected.
class FakeSourceParser : public SourceParser {
public:
    std::unique_ptr<SourceNode> parse(const Context &context) override {
        parsed.push_back(context.getFile());
        auto contents = context.getContents();
        if (!contents || llvm::StringRef(*contents).contains("broken"))
            return nullptr;

        auto unit = std::make_unique<SourceNode>(SourceNode::Kind::CompilationUnit,
                                                 context.getFile());
        unit->appendChild(SourceNode::Kind::ClassDeclaration,
                          llvm::sys::path::stem(context.getFile()).str());
        return unit;
    }

    std::vector<std::string> parsed;
};

// Reads "class files" whose bytes are the class name. "BAD..." fails to
// parse; "SUPPRESSED..." carries @SuppressLint("all").
class FakeClassReader : public ClassReader {
public:
    llvm::Expected<std::unique_ptr<ClassNode>> read(llvm::ArrayRef<uint8_t> bytes) override {
        llvm::StringRef text(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        if (text.startswith("BAD"))
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "malformed class file");

        auto node = std::make_unique<ClassNode>();
        node->name = text.trim().str();
        if (text.startswith("SUPPRESSED")) {
            AnnotationNode annotation;
            annotation.desc = "Landroid/annotation/SuppressLint;";
            annotation.values.emplace_back("value", std::string("all"));
            node->invisibleAnnotations.push_back(std::move(annotation));
        }
        return std::move(node);
    }
};

struct ReportedFinding {
    std::string issueId;
    std::string file;
    std::string message;
};

// Records reports and log messages. One configuration serves every
// project.
class FakeClient : public Client {
public:
    void report(const Context &context, const Issue &issue,
                const std::optional<Location> &location, llvm::StringRef message,
                const std::any &) override {
        reports.push_back({issue.getId(), location ? location->file : context.getFile(),
                           message.str()});
    }

    using Client::log;
    void log(llvm::Error error, const llvm::Twine &message) override {
        std::string text = message.str();
        if (error)
            text += ": " + llvm::toString(std::move(error));
        logs.push_back(text);
    }

    Configuration &getConfiguration(const Project &) override { return configuration; }

    MarkupParser *getMarkupParser() override { return markupParser; }
    SourceParser *getSourceParser() override { return sourceParser; }
    ClassReader *getClassReader() override { return classReader; }

    bool logged(llvm::StringRef fragment) const {
        for (const auto &line : logs) {
            if (llvm::StringRef(line).contains(fragment))
                return true;
        }
        return false;
    }

    YamlConfiguration configuration = YamlConfiguration::defaults();
    MarkupParser *markupParser = nullptr;
    SourceParser *sourceParser = nullptr;
    ClassReader *classReader = nullptr;
    std::vector<ReportedFinding> reports;
    std::vector<std::string> logs;
};

// Detector that appends "<kind>:<hook>:<file name>" to a shared event log
// and lets tests hook into any file-level callback.
class RecordingDetector : public Detector {
public:
    RecordingDetector(std::string kind, uint8_t capabilities, std::vector<std::string> &events,
                      int instance)
        : kind_(std::move(kind)), capabilities_(capabilities), events_(events),
          instance_(instance) {}

    std::string_view getKind() const override { return kind_; }
    uint8_t getCapabilities() const override { return capabilities_; }
    int getInstance() const { return instance_; }

    void beforeCheckProject(const Context &context) override {
        record("beforeCheckProject", context);
        if (onBeforeProject)
            onBeforeProject(*this, context);
    }
    void afterCheckProject(const Context &context) override {
        record("afterCheckProject", context);
    }
    void beforeCheckLibraryProject(const Context &context) override {
        record("beforeCheckLibraryProject", context);
    }
    void afterCheckLibraryProject(const Context &context) override {
        record("afterCheckLibraryProject", context);
    }

    bool appliesTo(const Context &context, llvm::StringRef file) override {
        return Detector::appliesTo(context, file);
    }
    bool appliesTo(ResourceFolderType type) override {
        return folderTypes.empty() || folderTypes.count(type) != 0;
    }

    void run(const Context &context) override { fileEvent("run", context); }

    std::vector<std::string> getApplicableElements() const override { return elements; }
    void visitDocument(const XmlContext &context, const MarkupDocument &) override {
        fileEvent("visitDocument", context);
    }
    void visitElement(const XmlContext &, const MarkupElement &element) override {
        events_.push_back(kind_ + ":visitElement:" + element.getTagName().str());
    }
    void visitSourceUnit(const SourceContext &context, const SourceNode &) override {
        fileEvent("visitSourceUnit", context);
    }
    void checkClass(const ClassContext &context, const ClassNode &classNode) override {
        events_.push_back(kind_ + ":checkClass:" + classNode.name);
        if (onFile)
            onFile(*this, context);
    }

    std::vector<std::string> elements;
    std::set<ResourceFolderType> folderTypes;
    std::function<void(RecordingDetector &, const Context &)> onBeforeProject;
    std::function<void(RecordingDetector &, const Context &)> onFile;

private:
    void record(llvm::StringRef hook, const Context &context) {
        events_.push_back(kind_ + ":" + hook.str() + ":" +
                          llvm::sys::path::filename(context.getFile()).str());
    }

    void fileEvent(llvm::StringRef hook, const Context &context) {
        record(hook, context);
        if (onFile)
            onFile(*this, context);
    }

    std::string kind_;
    uint8_t capabilities_;
    std::vector<std::string> &events_;
    int instance_;
};

// Local registry of recording detectors and their issues.
class TestRegistry {
public:
    const Issue &addIssue(std::string id, std::string kind, ScopeSet scope,
                          Severity severity = Severity::Warning,
                          bool enabledByDefault = true) {
        issues_.push_back(std::make_unique<Issue>(std::move(id), "Brief", "Explanation",
                                                  Category::correctness(), 5, severity,
                                                  std::move(kind), scope,
                                                  enabledByDefault));
        registry.registerIssue(*issues_.back());
        return *issues_.back();
    }

    // `configure` runs on every new instance of the detector.
    void addDetector(const std::string &kind, uint8_t capabilities,
                     std::function<void(RecordingDetector &)> configure = {}) {
        registry.registerDetector(kind, [this, kind, capabilities, configure] {
            auto detector = std::make_unique<RecordingDetector>(kind, capabilities, events,
                                                                ++created[kind]);
            if (configure)
                configure(*detector);
            return detector;
        });
    }

    IssueRegistry registry;
    std::vector<std::string> events;
    std::map<std::string, int> created;

private:
    std::vector<std::unique_ptr<Issue>> issues_;
};

// Records every event with the file name of its context.
class RecordingListener : public LintListener {
public:
    void update(LintDriver &driver, EventType type, const Context *context) override {
        std::string entry(eventTypeName(type));
        if (context)
            entry += ":" + llvm::sys::path::filename(context->getFile()).str();
        events.push_back(entry);
        phases.push_back(driver.getPhase());
    }

    size_t count(EventType type) const {
        size_t n = 0;
        std::string name(eventTypeName(type));
        for (const auto &e : events) {
            if (llvm::StringRef(e).startswith(name) &&
                (e.size() == name.size() || e[name.size()] == ':'))
                ++n;
        }
        return n;
    }

    std::vector<std::string> events;
    std::vector<int> phases;
};

inline size_t countPrefix(const std::vector<std::string> &events, llvm::StringRef prefix) {
    size_t n = 0;
    for (const auto &e : events) {
        if (llvm::StringRef(e).startswith(prefix))
            ++n;
    }
    return n;
}

} // namespace lintel::test
