#include "lintel/engine/ReportingFilter.h"
#include "lintel/core/IssueRegistry.h"
#include "lintel/engine/Context.h"

namespace lintel {

void ReportingFilter::report(const Context &context, const Issue &issue,
                             const std::optional<Location> &location,
                             llvm::StringRef message, const std::any &data) {
    Configuration &configuration = context.getConfiguration();

    if (!configuration.isEnabled(issue)) {
        // Parser errors are reported regardless of what is enabled.
        if (&issue != &IssueRegistry::parserError())
            delegate_.log("Incorrect detector reported disabled issue " + issue.getId());
        return;
    }

    if (configuration.isIgnored(context, issue, location, message))
        return;

    if (configuration.getSeverity(issue) == Severity::Ignore)
        return;

    delegate_.report(context, issue, location, message, data);
}

void ReportingFilter::log(llvm::Error error, const llvm::Twine &message) {
    delegate_.log(std::move(error), message);
}

Configuration &ReportingFilter::getConfiguration(const Project &project) {
    return delegate_.getConfiguration(project);
}

llvm::ErrorOr<std::string> ReportingFilter::readFile(llvm::StringRef path) {
    return delegate_.readFile(path);
}

std::vector<std::string> ReportingFilter::getSourceFolders(const Project &project) {
    return delegate_.getSourceFolders(project);
}

std::vector<std::string> ReportingFilter::getClassFolders(const Project &project) {
    return delegate_.getClassFolders(project);
}

MarkupParser *ReportingFilter::getMarkupParser() {
    return delegate_.getMarkupParser();
}

SourceParser *ReportingFilter::getSourceParser() {
    return delegate_.getSourceParser();
}

ClassReader *ReportingFilter::getClassReader() {
    return delegate_.getClassReader();
}

Project &ReportingFilter::getProject(llvm::StringRef dir, llvm::StringRef referenceDir) {
    return delegate_.getProject(dir, referenceDir);
}

} // namespace lintel
