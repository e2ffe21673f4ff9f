#include "lintel/engine/Context.h"
#include "lintel/client/Client.h"
#include "lintel/core/Configuration.h"
#include "lintel/engine/LintDriver.h"
#include "lintel/project/Project.h"

namespace lintel {

Context::Context(LintDriver &driver, Project &project, Project *main, std::string file)
    : driver_(&driver), project_(&project), main_(main), file_(std::move(file)) {}

Configuration &Context::getConfiguration() const {
    return project_->getConfiguration();
}

bool Context::isEnabled(const Issue &issue) const {
    return getConfiguration().isEnabled(issue);
}

ScopeSet Context::getScope() const {
    return driver_->getScope();
}

int Context::getPhase() const {
    return driver_->getPhase();
}

void Context::report(const Issue &issue, const std::optional<Location> &location,
                     llvm::StringRef message, const std::any &data) const {
    driver_->getClient().report(*this, issue, location, message, data);
}

void Context::requestRepeat(Detector &detector, std::optional<ScopeSet> scope) const {
    driver_->requestRepeat(detector, scope);
}

llvm::ErrorOr<std::string> Context::getContents() const {
    return driver_->getClient().readFile(file_);
}

bool SourceContext::isSuppressed(const Issue &issue, const SourceNode &node) const {
    return getDriver().isSuppressed(&issue, &node);
}

ClassContext::ClassContext(LintDriver &driver, Project &project, Project *main,
                           std::string file, std::optional<std::string> jarFile,
                           std::string binDir, llvm::ArrayRef<uint8_t> bytes,
                           const ClassNode &classNode)
    : Context(driver, project, main, std::move(file)),
      jarFile_(std::move(jarFile)),
      binDir_(std::move(binDir)),
      bytes_(bytes),
      classNode_(&classNode) {}

} // namespace lintel
