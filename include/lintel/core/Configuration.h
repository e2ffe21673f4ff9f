#pragma once

#include "lintel/core/Issue.h"
#include "lintel/core/Location.h"
#include "lintel/core/Severity.h"

#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>

#include <optional>
#include <string>
#include <vector>

namespace lintel {

class Context;

// Per-project view of which issues are enabled, at which severity, and
// which individual findings are ignored.
class Configuration {
public:
    virtual ~Configuration() = default;

    virtual Severity getSeverity(const Issue &issue) const = 0;

    virtual bool isIgnored(const Context &context, const Issue &issue,
                           const std::optional<Location> &location,
                           llvm::StringRef message) const = 0;

    virtual bool isEnabled(const Issue &issue) const {
        return getSeverity(issue) != Severity::Ignore;
    }
};

// Configuration read from a lintel.yaml file:
//
//   issues:
//     - id: WrongKeep
//       severity: error
//       ignore: [ "proguard*.cfg", "res/layout/*.xml" ]
//
// Ignore patterns are fnmatch-style and matched against the reported file
// relative to the project directory. The id "all" applies to every issue.
class YamlConfiguration : public Configuration {
public:
    static YamlConfiguration defaults();
    static YamlConfiguration loadFromFile(const std::string &path);
    static std::optional<YamlConfiguration> parse(llvm::StringRef yaml);

    Severity getSeverity(const Issue &issue) const override;
    bool isIgnored(const Context &context, const Issue &issue,
                   const std::optional<Location> &location,
                   llvm::StringRef message) const override;

    void setSeverity(llvm::StringRef issueId, Severity severity);
    void addIgnorePattern(llvm::StringRef issueId, std::string pattern);

private:
    bool matchesIgnore(llvm::StringRef issueId, llvm::StringRef relativePath) const;

    llvm::StringMap<Severity> severities_;
    llvm::StringMap<std::vector<std::string>> ignorePatterns_;
};

} // namespace lintel
