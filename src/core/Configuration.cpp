#include "lintel/core/Configuration.h"
#include "lintel/core/LintConstants.h"
#include "lintel/engine/Context.h"
#include "lintel/project/Project.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <fnmatch.h>

// On-disk layout of lintel.yaml, mapped through llvm::yaml.

namespace {

struct IssueEntry {
    std::string id;
    std::string severity;
    std::vector<std::string> ignore;
};

struct ConfigDocument {
    std::vector<IssueEntry> issues;
};

} // anonymous namespace

LLVM_YAML_IS_SEQUENCE_VECTOR(IssueEntry)

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<IssueEntry> {
    static void mapping(IO &io, IssueEntry &entry) {
        io.mapRequired("id",       entry.id);
        io.mapOptional("severity", entry.severity);
        io.mapOptional("ignore",   entry.ignore);
    }

    static std::string validate(IO &, IssueEntry &entry) {
        if (!entry.severity.empty() && !lintel::parseSeverity(entry.severity))
            return "unknown severity '" + entry.severity + "' for issue " + entry.id;
        return {};
    }
};

template <>
struct MappingTraits<ConfigDocument> {
    static void mapping(IO &io, ConfigDocument &doc) {
        io.mapOptional("issues", doc.issues);
    }
};

} // namespace yaml
} // namespace llvm

namespace lintel {

YamlConfiguration YamlConfiguration::defaults() {
    return YamlConfiguration{};
}

std::optional<YamlConfiguration> YamlConfiguration::parse(llvm::StringRef yaml) {
    ConfigDocument doc;
    llvm::yaml::Input yin(yaml);
    yin >> doc;
    if (yin.error())
        return std::nullopt;

    YamlConfiguration cfg;
    for (auto &entry : doc.issues) {
        if (!entry.severity.empty())
            cfg.setSeverity(entry.id, *parseSeverity(entry.severity));
        for (auto &pattern : entry.ignore)
            cfg.addIgnorePattern(entry.id, std::move(pattern));
    }
    return cfg;
}

YamlConfiguration YamlConfiguration::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "lintel: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    auto cfg = parse(bufOrErr.get()->getBuffer());
    if (!cfg) {
        llvm::errs() << "lintel: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return std::move(*cfg);
}

void YamlConfiguration::setSeverity(llvm::StringRef issueId, Severity severity) {
    severities_[issueId] = severity;
}

void YamlConfiguration::addIgnorePattern(llvm::StringRef issueId,
                                         std::string pattern) {
    ignorePatterns_[issueId].push_back(std::move(pattern));
}

Severity YamlConfiguration::getSeverity(const Issue &issue) const {
    auto it = severities_.find(issue.getId());
    if (it != severities_.end())
        return it->second;

    it = severities_.find(kSuppressAll);
    if (it != severities_.end())
        return it->second;

    if (!issue.isEnabledByDefault())
        return Severity::Ignore;
    return issue.getDefaultSeverity();
}

bool YamlConfiguration::matchesIgnore(llvm::StringRef issueId,
                                      llvm::StringRef relativePath) const {
    auto it = ignorePatterns_.find(issueId);
    if (it == ignorePatterns_.end())
        return false;

    std::string path = relativePath.str();
    for (const auto &pat : it->second) {
        if (fnmatch(pat.c_str(), path.c_str(), 0) == 0)
            return true;
    }
    return false;
}

bool YamlConfiguration::isIgnored(const Context &context, const Issue &issue,
                                  const std::optional<Location> &location,
                                  llvm::StringRef /*message*/) const {
    if (ignorePatterns_.empty())
        return false;

    llvm::SmallString<256> path(location && !location->file.empty()
                                    ? llvm::StringRef(location->file)
                                    : llvm::StringRef(context.getFile()));
    llvm::sys::path::replace_path_prefix(path, context.getProject().getDir(), "");
    llvm::StringRef relative = path;
    relative = relative.ltrim(llvm::sys::path::get_separator());

    return matchesIgnore(issue.getId(), relative) ||
           matchesIgnore(kSuppressAll, relative);
}

} // namespace lintel
