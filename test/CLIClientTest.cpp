#include "TestSupport.h"

#include "lintel/driver/CLIClient.h"

using namespace lintel;
using namespace lintel::test;

class CLIClientTest : public ::testing::Test {
protected:
    TempTree tree;
    TestRegistry test;
};

TEST_F(CLIClientTest, CancelNoticeKeepsItsSeverity) {
    std::string app = tree.makeProject("app");
    std::string config = tree.write("lintel.yaml", "issues:\n"
                                                   "  - id: all\n"
                                                   "    severity: ignore\n"
                                                   "  - id: SourceCheck\n"
                                                   "    severity: warning\n");
    test.addIssue("SourceCheck", "src", scopes::kSourceFile);
    test.addDetector("src", kSourceScanner, [](RecordingDetector &detector) {
        detector.onBeforeProject = [](RecordingDetector &, const Context &context) {
            context.getDriver().cancel();
        };
    });

    CLIOptions options;
    options.configPath = config;
    CLIClient client(std::move(options));
    LintDriver driver(test.registry, client);
    driver.analyze({app});

    ASSERT_EQ(client.getWarnings().size(), 1u);
    const Warning &notice = client.getWarnings()[0];
    EXPECT_EQ(notice.issueId, "Lint");
    EXPECT_EQ(notice.message, "Lint canceled by user");
    EXPECT_EQ(notice.severity, IssueRegistry::canceled().getDefaultSeverity());
    EXPECT_NE(notice.severity, Severity::Ignore);
}

TEST_F(CLIClientTest, DisabledIdsOverrideConfiguration) {
    std::string app = tree.makeProject("app");
    test.addIssue("SourceCheck", "src", scopes::kSourceFile);

    CLIOptions options;
    options.disabledIssues.push_back("SourceCheck");
    CLIClient client(std::move(options));

    const Issue *issue = test.registry.findById("SourceCheck");
    ASSERT_NE(issue, nullptr);
    Project &project = client.getProject(app, app);
    EXPECT_FALSE(client.getConfiguration(project).isEnabled(*issue));
}
