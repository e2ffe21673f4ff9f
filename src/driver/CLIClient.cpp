#include "lintel/driver/CLIClient.h"
#include "lintel/core/FileUtils.h"
#include "lintel/core/IssueRegistry.h"
#include "lintel/core/LintConstants.h"
#include "lintel/engine/Context.h"
#include "lintel/project/Project.h"

#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <tuple>

namespace lintel {

CLIClient::CLIClient(CLIOptions options) : options_(std::move(options)) {}

void CLIClient::report(const Context &context, const Issue &issue,
                       const std::optional<Location> &location, llvm::StringRef message,
                       const std::any & /*data*/) {
    Warning w;
    w.issueId = issue.getId();
    w.category = std::string(issue.getCategory().name);
    w.priority = issue.getPriority();
    // The cancel notice is not subject to configuration.
    w.severity = &issue == &IssueRegistry::canceled()
                     ? issue.getDefaultSeverity()
                     : context.getConfiguration().getSeverity(issue);
    w.project = context.getMainProject().getName().str();
    if (location) {
        w.file = location->file;
        if (location->start) {
            w.line = location->start->line;
            w.column = location->start->column;
        }
    }
    w.message = message.str();
    warnings_.push_back(std::move(w));
}

void CLIClient::log(llvm::Error error, const llvm::Twine &message) {
    std::string text = message.str();
    llvm::errs() << "lintel: warning: " << text;
    if (error) {
        if (!text.empty())
            llvm::errs() << ": ";
        llvm::errs() << llvm::toString(std::move(error));
    }
    llvm::errs() << "\n";
}

Configuration &CLIClient::getConfiguration(const Project &project) {
    auto &slot = configurations_[&project];
    if (!slot)
        slot = loadConfiguration(project);
    return *slot;
}

std::unique_ptr<YamlConfiguration> CLIClient::loadConfiguration(const Project &project) const {
    std::string path = options_.configPath;
    if (path.empty()) {
        std::string local = joinPath(project.getDir(), kConfigFile);
        if (isRegularFile(local))
            path = std::move(local);
    }

    auto configuration = std::make_unique<YamlConfiguration>(
        path.empty() ? YamlConfiguration::defaults() : YamlConfiguration::loadFromFile(path));
    for (const std::string &id : options_.disabledIssues)
        configuration->setSeverity(id, Severity::Ignore);
    return configuration;
}

void CLIClient::sortWarnings() {
    std::stable_sort(warnings_.begin(), warnings_.end(),
                     [](const Warning &a, const Warning &b) {
                         if (a.severity != b.severity)
                             return static_cast<uint8_t>(a.severity) >
                                    static_cast<uint8_t>(b.severity);
                         if (a.priority != b.priority)
                             return a.priority > b.priority;
                         return std::tie(a.file, a.line, a.column) <
                                std::tie(b.file, b.line, b.column);
                     });
}

} // namespace lintel
