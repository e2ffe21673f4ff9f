#include "lintel/core/IssueRegistry.h"
#include "lintel/core/Scope.h"
#include "lintel/core/Version.h"
#include "lintel/driver/CLIClient.h"
#include "lintel/engine/LintDriver.h"
#include "lintel/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

static llvm::cl::OptionCategory LintelCat("lintel options");

static llvm::cl::list<std::string> InputPaths(
    llvm::cl::Positional,
    llvm::cl::desc("<project directories or files>"),
    llvm::cl::cat(LintelCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to a lintel.yaml used for every project"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(LintelCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json)"),
    llvm::cl::init("cli"),
    llvm::cl::cat(LintelCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(LintelCat));

static llvm::cl::opt<std::string> ScopeList(
    "scope",
    llvm::cl::desc("Comma separated scopes to check (manifest, resource-file, "
                   "all-resource-files, source-file, all-source-files, "
                   "class-file, proguard-file); inferred from the paths by default"),
    llvm::cl::value_desc("list"),
    llvm::cl::cat(LintelCat));

static llvm::cl::list<std::string> DisabledIssues(
    "disable",
    llvm::cl::desc("Issue ids to turn off"),
    llvm::cl::CommaSeparated,
    llvm::cl::value_desc("ids"),
    llvm::cl::cat(LintelCat));

static llvm::cl::opt<bool> ListIssues(
    "list-issues",
    llvm::cl::desc("List the registered issues and exit"),
    llvm::cl::cat(LintelCat));

namespace {

// Notices whether the run got as far as checking any project.
class StartListener : public lintel::LintListener {
public:
    void update(lintel::LintDriver &, lintel::EventType type,
                const lintel::Context *) override {
        if (type == lintel::EventType::Starting)
            started = true;
    }

    bool started = false;
};

void listIssues(const lintel::IssueRegistry &registry) {
    for (const lintel::Issue *issue : registry.getIssues()) {
        llvm::outs() << issue->getId() << " ["
                     << lintel::severityToString(issue->getDefaultSeverity()) << ", "
                     << issue->getCategory().name << "]: "
                     << issue->getBriefDescription() << "\n";
    }
}

} // anonymous namespace

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(LintelCat);
    llvm::cl::SetVersionPrinter([](llvm::raw_ostream &os) {
        os << "lintel " << lintel::kToolVersion << "\n";
    });
    llvm::cl::ParseCommandLineOptions(argc, argv, "lintel project checker\n");

    const lintel::IssueRegistry &registry = lintel::IssueRegistry::builtin();

    if (ListIssues) {
        listIssues(registry);
        return 0;
    }

    if (InputPaths.empty()) {
        llvm::errs() << "lintel: error: no input paths\n";
        return 2;
    }

    std::optional<lintel::ScopeSet> scope;
    if (!ScopeList.empty()) {
        scope = lintel::parseScopeList(ScopeList);
        if (!scope || scope->empty()) {
            llvm::errs() << "lintel: error: invalid scope list '" << ScopeList << "'\n";
            return 2;
        }
    }

    lintel::CLIOptions options;
    options.configPath = ConfigPath.getValue();
    for (const auto &id : DisabledIssues) {
        if (!registry.findById(id))
            llvm::errs() << "lintel: warning: unknown issue id '" << id << "'\n";
        options.disabledIssues.push_back(id);
    }

    lintel::CLIClient client(std::move(options));
    lintel::LintDriver driver(registry, client);
    StartListener listener;
    driver.addLintListener(listener);

    std::vector<std::string> paths(InputPaths.begin(), InputPaths.end());
    driver.analyze(paths, scope);

    if (!listener.started)
        return 2;

    client.sortWarnings();

    std::unique_ptr<lintel::OutputFormatter> formatter;
    if (OutputFormat == "json")
        formatter = std::make_unique<lintel::JSONOutputFormatter>();
    else
        formatter = std::make_unique<lintel::CLIOutputFormatter>();

    std::string output = formatter->format(client.getWarnings());

    // Emit.
    if (OutputFile.empty()) {
        llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(OutputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "lintel: error: cannot open output file '"
                         << OutputFile << "': " << EC.message() << "\n";
            return 1;
        }
        file << output;
    }

    return client.getWarnings().empty() ? 0 : 1;
}
