#include "lintel/core/IssueRegistry.h"
#include "lintel/client/Client.h"
#include "lintel/core/Configuration.h"

#include <llvm/ADT/MapVector.h>

#include <algorithm>

namespace lintel {

IssueRegistry &IssueRegistry::builtin() {
    static IssueRegistry registry;
    return registry;
}

const Issue &IssueRegistry::parserError() {
    static const Issue issue(
        "ParserError", "Parser Errors",
        "Lint will ignore any files that contain fatal parsing errors. These "
        "may contain other errors, or contain code which affects issues in "
        "other files.",
        Category::correctness(), 10, Severity::Error, /*detectorKind=*/"",
        scopes::kResourceFile);
    return issue;
}

const Issue &IssueRegistry::canceled() {
    static const Issue issue("Lint", "", "", Category::performance(), 0,
                             Severity::Informational, /*detectorKind=*/"",
                             ScopeSet{});
    return issue;
}

void IssueRegistry::registerDetector(std::string kind, DetectorFactory factory) {
    factories_[kind] = std::move(factory);
}

void IssueRegistry::registerIssue(const Issue &issue) {
    if (std::find(issues_.begin(), issues_.end(), &issue) == issues_.end())
        issues_.push_back(&issue);
}

std::vector<const Issue *> IssueRegistry::issuesForKind(std::string_view kind) const {
    std::vector<const Issue *> result;
    for (const Issue *issue : issues_) {
        if (issue->getDetectorKind() == kind)
            result.push_back(issue);
    }
    return result;
}

const Issue *IssueRegistry::findById(std::string_view id) const {
    auto it = std::find_if(issues_.begin(), issues_.end(),
                           [id](const Issue *i) { return i->getId() == id; });
    return (it != issues_.end()) ? *it : nullptr;
}

DetectorSet IssueRegistry::createDetectors(Client &client,
                                           const Configuration &configuration,
                                           ScopeSet scope) const {
    // Scope union per detector kind, in order of first appearance.
    llvm::MapVector<llvm::StringRef, ScopeSet> kindScopes;
    for (const Issue *issue : issues_) {
        if (issue->getDetectorKind().empty())
            continue;
        if (!configuration.isEnabled(*issue))
            continue;
        if (!scope.containsAll(issue->getScope()))
            continue;

        ScopeSet &s = kindScopes[issue->getDetectorKind()];
        s = s | issue->getScope();
    }

    DetectorSet result;
    for (const auto &[kind, kindScope] : kindScopes) {
        auto factory = factories_.find(kind);
        if (factory == factories_.end()) {
            client.log("No detector registered for kind " + kind);
            continue;
        }

        result.detectors.push_back(factory->second());
        Detector *detector = result.detectors.back().get();
        for (Scope s : kAllScopes) {
            if (kindScope.contains(s))
                result.scopeDetectors[s].push_back(detector);
        }
    }

    return result;
}

} // namespace lintel
