#pragma once

#include "lintel/core/Scope.h"
#include "lintel/core/Severity.h"

#include <string>
#include <string_view>

namespace lintel {

struct Category {
    std::string_view name;
    int priority = 0;   // higher sorts first

    static const Category &correctness();
    static const Category &performance();
    static const Category &security();
    static const Category &usability();
    static const Category &lint();
};

// A type of problem a detector can report. Issues are registered once and
// referenced by address for the lifetime of the registry holding them.
class Issue {
public:
    Issue(std::string id, std::string briefDescription, std::string explanation,
          const Category &category, int priority, Severity defaultSeverity,
          std::string detectorKind, ScopeSet scope,
          bool enabledByDefault = true);

    const std::string &getId() const { return id_; }
    const std::string &getBriefDescription() const { return briefDescription_; }
    const std::string &getExplanation() const { return explanation_; }
    const Category &getCategory() const { return *category_; }
    int getPriority() const { return priority_; }
    Severity getDefaultSeverity() const { return defaultSeverity_; }
    const std::string &getDetectorKind() const { return detectorKind_; }
    ScopeSet getScope() const { return scope_; }
    bool isEnabledByDefault() const { return enabledByDefault_; }

private:
    std::string id_;
    std::string briefDescription_;
    std::string explanation_;
    const Category *category_;
    int priority_;                  // 1..10
    Severity defaultSeverity_;
    std::string detectorKind_;
    ScopeSet scope_;
    bool enabledByDefault_;
};

} // namespace lintel
