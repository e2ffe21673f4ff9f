#include "lintel/core/Issue.h"

#include <algorithm>
#include <utility>

namespace lintel {

const Category &Category::correctness() {
    static const Category category{"Correctness", 100};
    return category;
}

const Category &Category::security() {
    static const Category category{"Security", 90};
    return category;
}

const Category &Category::performance() {
    static const Category category{"Performance", 80};
    return category;
}

const Category &Category::usability() {
    static const Category category{"Usability", 70};
    return category;
}

const Category &Category::lint() {
    static const Category category{"Lint", 110};
    return category;
}

Issue::Issue(std::string id, std::string briefDescription,
             std::string explanation, const Category &category, int priority,
             Severity defaultSeverity, std::string detectorKind, ScopeSet scope,
             bool enabledByDefault)
    : id_(std::move(id)), briefDescription_(std::move(briefDescription)),
      explanation_(std::move(explanation)), category_(&category),
      priority_(std::clamp(priority, 1, 10)), defaultSeverity_(defaultSeverity),
      detectorKind_(std::move(detectorKind)), scope_(scope),
      enabledByDefault_(enabledByDefault) {}

} // namespace lintel
