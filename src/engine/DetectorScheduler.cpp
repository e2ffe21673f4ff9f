#include "lintel/engine/DetectorScheduler.h"
#include "lintel/core/Configuration.h"
#include "lintel/core/Detector.h"
#include "lintel/core/LintConstants.h"
#include "lintel/project/Project.h"

#include <cassert>

namespace lintel {

bool DetectorScheduler::computeDetectors(Project &project, ScopeSet scope) {
    owned_ = registry_.createDetectors(client_, project.getConfiguration(), scope);

    applicable_.clear();
    for (const auto &detector : owned_.detectors)
        applicable_.push_back(detector.get());
    scopeDetectors_ = owned_.scopeDetectors;

    clearRepeatRequests();
    validateScopeList();
    return !applicable_.empty();
}

bool DetectorScheduler::computeRepeatingDetectors(Project &project) {
    const Configuration &configuration = project.getConfiguration();

    std::vector<Detector *> detectors;
    ScopeDetectorMap scopeDetectors;
    for (Detector *detector : repeatDetectors_) {
        // A repeat requested while checking another project does not
        // enable the detector here.
        ScopeSet detectorScope;
        bool enabled = false;
        for (const Issue *issue : registry_.issuesForKind(detector->getKind())) {
            if (!configuration.isEnabled(*issue))
                continue;
            enabled = true;
            detectorScope = detectorScope | issue->getScope();
        }
        if (!enabled)
            continue;

        detectors.push_back(detector);
        for (Scope s : kAllScopes) {
            if (detectorScope.contains(s))
                scopeDetectors[s].push_back(detector);
        }
    }

    applicable_ = std::move(detectors);
    scopeDetectors_ = std::move(scopeDetectors);

    clearRepeatRequests();
    validateScopeList();
    return !applicable_.empty();
}

void DetectorScheduler::requestRepeat(Detector &detector, std::optional<ScopeSet> scope) {
    repeatDetectors_.insert(&detector);
    ScopeSet requested = scope.value_or(ScopeSet::all());
    repeatScope_ = repeatScope_ ? (*repeatScope_ | requested) : requested;
}

bool DetectorScheduler::advancePhase() {
    if (phase_ >= kMaxPhases)
        return false;
    ++phase_;
    return true;
}

llvm::ArrayRef<Detector *> DetectorScheduler::detectorsFor(Scope scope) const {
    auto it = scopeDetectors_.find(scope);
    if (it == scopeDetectors_.end())
        return {};
    return it->second;
}

void DetectorScheduler::reset() {
    applicable_.clear();
    scopeDetectors_.clear();
    owned_ = DetectorSet();
    clearRepeatRequests();
}

void DetectorScheduler::clearRepeatRequests() {
    repeatDetectors_.clear();
    repeatScope_.reset();
}

// Every detector must be able to scan what its buckets hand it.
void DetectorScheduler::validateScopeList() const {
#ifndef NDEBUG
    for (const auto &[scope, detectors] : scopeDetectors_) {
        for (const Detector *detector : detectors) {
            switch (scope) {
                case Scope::Manifest:
                case Scope::ResourceFile:
                    assert(detector->hasCapability(kMarkupScanner) &&
                           "markup scope holds a detector that cannot scan markup");
                    break;
                case Scope::SourceFile:
                case Scope::AllSourceFiles:
                    assert(detector->hasCapability(kSourceScanner) &&
                           "source scope holds a detector that cannot scan sources");
                    break;
                case Scope::ClassFile:
                    assert(detector->hasCapability(kClassScanner) &&
                           "class scope holds a detector that cannot scan classes");
                    break;
                case Scope::AllResourceFiles:
                case Scope::ProguardFile:
                    break;
            }
        }
    }
#endif
}

} // namespace lintel
