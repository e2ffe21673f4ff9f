#pragma once

#include "lintel/core/IssueRegistry.h"
#include "lintel/core/Scope.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SetVector.h>

#include <optional>
#include <vector>

namespace lintel {

class Client;
class Detector;
class Project;

// Decides which detector instances run for a project and in which scope
// buckets, across up to kMaxPhases passes.
class DetectorScheduler {
public:
    DetectorScheduler(const IssueRegistry &registry, Client &client)
        : registry_(registry), client_(client) {}

    // Phase 1: instantiates the detectors applicable to `scope` under the
    // project's configuration and clears pending repeat requests. Returns
    // false when nothing applies and the project should be skipped.
    bool computeDetectors(Project &project, ScopeSet scope);

    // Narrows the detector list to the instances that asked for another
    // pass and still have an issue enabled for `project`. Consumes the
    // repeat requests. Returns false when none remain.
    bool computeRepeatingDetectors(Project &project);

    // Records `detector` for another pass over `scope`, or over everything
    // when no scope is given.
    void requestRepeat(Detector &detector, std::optional<ScopeSet> scope);
    bool hasRepeatRequests() const { return !repeatDetectors_.empty(); }
    ScopeSet getRepeatScope() const { return repeatScope_.value_or(ScopeSet::all()); }

    void beginProject() { phase_ = 1; }
    int getPhase() const { return phase_; }
    // Moves to the next phase. Returns false once the phase cap is reached.
    bool advancePhase();

    llvm::ArrayRef<Detector *> getApplicableDetectors() const { return applicable_; }
    llvm::ArrayRef<Detector *> detectorsFor(Scope scope) const;

    // Releases the detector instances of the finished project.
    void reset();

private:
    void clearRepeatRequests();
    void validateScopeList() const;

    const IssueRegistry &registry_;
    Client &client_;
    DetectorSet owned_;
    std::vector<Detector *> applicable_;
    ScopeDetectorMap scopeDetectors_;
    llvm::SetVector<Detector *> repeatDetectors_;
    std::optional<ScopeSet> repeatScope_;
    int phase_ = 1;
};

} // namespace lintel
