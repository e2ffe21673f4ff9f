#pragma once

#include "lintel/core/Scope.h"
#include "lintel/engine/CancellationToken.h"
#include "lintel/engine/DetectorScheduler.h"
#include "lintel/engine/FileDispatcher.h"
#include "lintel/engine/LintListener.h"
#include "lintel/engine/ReportingFilter.h"

#include <llvm/ADT/ArrayRef.h>

#include <optional>
#include <string>

namespace lintel {

class Client;
class Detector;
class Issue;
class IssueRegistry;
class Project;
class SourceNode;
struct ClassNode;
struct FieldNode;
struct MethodNode;

// Entry point of an analysis run. Resolves the given paths to projects
// and checks each of them with the detectors of `registry`, reporting
// through `client`.
class LintDriver {
public:
    LintDriver(const IssueRegistry &registry, Client &client);
    ~LintDriver();

    LintDriver(const LintDriver &) = delete;
    LintDriver &operator=(const LintDriver &) = delete;

    // Analyzes `files` (project directories, folders or files inside
    // projects). Without an explicit scope it is inferred from the paths.
    void analyze(llvm::ArrayRef<std::string> files,
                 std::optional<ScopeSet> scope = std::nullopt);

    // May be called from any hook or listener; the run stops at the next
    // unit boundary.
    void cancel() { cancel_.cancel(); }
    bool isCanceled() const { return cancel_.isCanceled(); }

    ScopeSet getScope() const { return scope_; }
    int getPhase() const { return scheduler_.getPhase(); }

    // The client as seen by detectors: reports pass through the filter.
    Client &getClient() { return filter_; }
    const IssueRegistry &getRegistry() const { return registry_; }

    // Asks for another pass of `detector` over `scope` (everything when
    // unset) once the current pass over the project finishes.
    void requestRepeat(Detector &detector, std::optional<ScopeSet> scope = std::nullopt);

    void addLintListener(LintListener &listener) { notifier_.addListener(listener); }
    void removeLintListener(LintListener &listener) { notifier_.removeListener(listener); }
    void fireEvent(EventType type, const Context *context);

    bool isSuppressed(const Issue *issue, const ClassNode &classNode) const;
    bool isSuppressed(const Issue *issue, const MethodNode &method) const;
    bool isSuppressed(const Issue *issue, const FieldNode &field) const;
    bool isSuppressed(const Issue *issue, const SourceNode *node) const;

private:
    void runExtraPhases(Project &project);
    void reportCanceled(Project &project);

    const IssueRegistry &registry_;
    ReportingFilter filter_;
    CancellationToken cancel_;
    EventNotifier notifier_;
    DetectorScheduler scheduler_;
    FileDispatcher dispatcher_;
    ScopeSet scope_;
};

} // namespace lintel
