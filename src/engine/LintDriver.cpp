#include "lintel/engine/LintDriver.h"
#include "lintel/core/IssueRegistry.h"
#include "lintel/engine/Context.h"
#include "lintel/engine/ProjectResolver.h"
#include "lintel/engine/SuppressionResolver.h"
#include "lintel/project/Project.h"

#include <llvm/ADT/StringExtras.h>

namespace lintel {

LintDriver::LintDriver(const IssueRegistry &registry, Client &client)
    : registry_(registry),
      filter_(client),
      scheduler_(registry, filter_),
      dispatcher_(*this, scheduler_, cancel_) {}

LintDriver::~LintDriver() = default;

void LintDriver::analyze(llvm::ArrayRef<std::string> files, std::optional<ScopeSet> scope) {
    cancel_.reset();

    std::vector<Project *> projects = ProjectResolver(filter_, cancel_).resolve(files);
    if (projects.empty()) {
        if (!cancel_.isCanceled())
            filter_.log("No projects found for " + llvm::join(files, ", "));
        return;
    }

    scope_ = scope ? *scope : inferScope(projects);

    fireEvent(EventType::Starting, nullptr);

    for (Project *project : projects) {
        scheduler_.beginProject();

        // The detectors available vary between projects.
        dispatcher_.invalidateVisitorCache();
        if (!scheduler_.computeDetectors(*project, scope_))
            continue;

        dispatcher_.checkProject(*project);
        if (!cancel_.isCanceled())
            runExtraPhases(*project);

        scheduler_.reset();
        dispatcher_.invalidateVisitorCache();

        if (cancel_.isCanceled()) {
            reportCanceled(*project);
            break;
        }
    }

    fireEvent(cancel_.isCanceled() ? EventType::Canceled : EventType::Completed, nullptr);
}

void LintDriver::runExtraPhases(Project &project) {
    if (!scheduler_.hasRepeatRequests())
        return;

    // Repeats narrow the scope for this project only.
    ScopeSet oldScope = scope_;

    while (scheduler_.hasRepeatRequests() && scheduler_.advancePhase()) {
        Context projectContext(*this, project, nullptr, project.getDir().str());
        fireEvent(EventType::NewPhase, &projectContext);

        scope_ = ScopeSet::intersect(scope_, scheduler_.getRepeatScope());
        if (scope_.empty())
            break;

        // Same detector instances as the previous pass, so state gathered
        // there is still available.
        dispatcher_.invalidateVisitorCache();
        if (!scheduler_.computeRepeatingDetectors(project))
            continue;

        dispatcher_.checkProject(project);
        if (cancel_.isCanceled())
            break;
    }

    scope_ = oldScope;
}

void LintDriver::reportCanceled(Project &project) {
    Context projectContext(*this, project, nullptr, project.getDir().str());
    // Bypasses the filter so that the notice is never configured away.
    filter_.getDelegate().report(projectContext, IssueRegistry::canceled(), std::nullopt,
                                 "Lint canceled by user", {});
}

void LintDriver::requestRepeat(Detector &detector, std::optional<ScopeSet> scope) {
    scheduler_.requestRepeat(detector, scope);
}

void LintDriver::fireEvent(EventType type, const Context *context) {
    notifier_.fire(*this, type, context);
}

bool LintDriver::isSuppressed(const Issue *issue, const ClassNode &classNode) const {
    return suppression::isSuppressed(issue, classNode);
}

bool LintDriver::isSuppressed(const Issue *issue, const MethodNode &method) const {
    return suppression::isSuppressed(issue, method);
}

bool LintDriver::isSuppressed(const Issue *issue, const FieldNode &field) const {
    return suppression::isSuppressed(issue, field);
}

bool LintDriver::isSuppressed(const Issue *issue, const SourceNode *node) const {
    return suppression::isSuppressed(issue, node);
}

} // namespace lintel
