#pragma once

#include "lintel/core/Detector.h"
#include "lintel/core/Issue.h"
#include "lintel/core/Scope.h"

#include <llvm/ADT/StringMap.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lintel {

class Client;
class Configuration;

using ScopeDetectorMap = std::map<Scope, std::vector<Detector *>>;

// Detectors instantiated for one project, with the scope buckets they were
// placed in. The map points into `detectors`.
struct DetectorSet {
    std::vector<std::unique_ptr<Detector>> detectors;
    ScopeDetectorMap scopeDetectors;
};

class IssueRegistry {
public:
    using DetectorFactory = std::function<std::unique_ptr<Detector>()>;

    IssueRegistry() = default;
    IssueRegistry(const IssueRegistry &) = delete;
    IssueRegistry &operator=(const IssueRegistry &) = delete;

    // Registry filled by LINTEL_REGISTER_DETECTOR.
    static IssueRegistry &builtin();

    // Reserved issue reported by parsers for unparseable files.
    static const Issue &parserError();
    // Placeholder carried by the report that announces a canceled run.
    static const Issue &canceled();

    void registerDetector(std::string kind, DetectorFactory factory);
    // The issue must outlive the registry.
    void registerIssue(const Issue &issue);

    const std::vector<const Issue *> &getIssues() const { return issues_; }
    std::vector<const Issue *> issuesForKind(std::string_view kind) const;
    const Issue *findById(std::string_view id) const;

    // Instantiates one detector per kind that has at least one issue enabled
    // in `configuration` whose scope fits inside `scope`. Each detector is
    // placed in the bucket of every scope of those issues.
    DetectorSet createDetectors(Client &client, const Configuration &configuration,
                                ScopeSet scope) const;

private:
    std::vector<const Issue *> issues_;
    llvm::StringMap<DetectorFactory> factories_;
};

// Static self-registration for detector implementations. The class must
// provide `static constexpr std::string_view kKind` and
// `static std::vector<const Issue *> getIssues()`.
#define LINTEL_REGISTER_DETECTOR(DetectorClass)                                \
    namespace {                                                                \
    struct DetectorClass##Registrar {                                          \
        DetectorClass##Registrar() {                                           \
            auto &registry = ::lintel::IssueRegistry::builtin();               \
            registry.registerDetector(std::string(DetectorClass::kKind), [] {  \
                return std::make_unique<DetectorClass>();                      \
            });                                                                \
            for (const ::lintel::Issue *issue : DetectorClass::getIssues())    \
                registry.registerIssue(*issue);                                \
        }                                                                      \
    };                                                                         \
    static DetectorClass##Registrar g_##DetectorClass##Registrar;              \
    } // anonymous namespace

} // namespace lintel
