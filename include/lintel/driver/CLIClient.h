#pragma once

#include "lintel/client/Client.h"
#include "lintel/core/Configuration.h"
#include "lintel/output/OutputFormatter.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lintel {

struct CLIOptions {
    // lintel.yaml applied to every project instead of the per-project file.
    std::string configPath;
    // Issue ids turned off on top of the configuration.
    std::vector<std::string> disabledIssues;
};

// Client used by the lintel executable: collects findings for the output
// formatters and prints diagnostics to stderr.
class CLIClient : public Client {
public:
    explicit CLIClient(CLIOptions options);

    void report(const Context &context, const Issue &issue,
                const std::optional<Location> &location, llvm::StringRef message,
                const std::any &data) override;

    using Client::log;
    void log(llvm::Error error, const llvm::Twine &message) override;

    Configuration &getConfiguration(const Project &project) override;

    const std::vector<Warning> &getWarnings() const { return warnings_; }
    // Most severe first, then by file and line.
    void sortWarnings();

private:
    std::unique_ptr<YamlConfiguration> loadConfiguration(const Project &project) const;

    CLIOptions options_;
    std::vector<Warning> warnings_;
    std::map<const Project *, std::unique_ptr<YamlConfiguration>> configurations_;
};

} // namespace lintel
