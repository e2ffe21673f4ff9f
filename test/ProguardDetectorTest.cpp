#include "TestSupport.h"

#include "lintel/driver/CLIClient.h"

using namespace lintel;
using namespace lintel::test;

class ProguardDetectorTest : public ::testing::Test {
protected:
    const std::vector<Warning> &check(llvm::StringRef proguard) {
        std::string app = tree.makeProject("app");
        tree.write("app/proguard.cfg", proguard);
        LintDriver driver(IssueRegistry::builtin(), client);
        driver.analyze({app});
        return client.getWarnings();
    }

    TempTree tree;
    CLIClient client{CLIOptions()};
};

TEST_F(ProguardDetectorTest, ObsoleteKeepRuleIsReported) {
    const auto &warnings = check("-keep class com.example.Main\n"
                                 "-keepclasseswithmembernames class * {\n"
                                 "    public <init>(android.content.Context, "
                                 "android.util.AttributeSet);\n"
                                 "}\n");

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].issueId, "WrongKeep");
    EXPECT_EQ(warnings[0].severity, Severity::Fatal);
    EXPECT_EQ(warnings[0].file, tree.path("app/proguard.cfg"));
    EXPECT_EQ(warnings[0].line, 2u);
    EXPECT_EQ(warnings[0].project, "app");
}

TEST_F(ProguardDetectorTest, NativeMethodRuleIsFine) {
    const auto &warnings = check("-keepclasseswithmembernames class * {\n"
                                 "    native <methods>;\n"
                                 "}\n"
                                 "-keepclasseswithmembers class * {\n"
                                 "    public <init>(android.content.Context);\n"
                                 "}\n");
    EXPECT_TRUE(warnings.empty());
}

TEST(ProguardDetectorConfigTest, DisabledFromCommandLine) {
    TempTree tree;
    std::string app = tree.makeProject("app");
    tree.write("app/proguard.cfg", "-keepclasseswithmembernames class * {\n"
                                   "    <init>(android.content.Context);\n"
                                   "}\n");
    CLIOptions options;
    options.disabledIssues.push_back("WrongKeep");
    CLIClient client(std::move(options));
    RecordingListener listener;

    LintDriver driver(IssueRegistry::builtin(), client);
    driver.addLintListener(listener);
    driver.analyze({app});

    EXPECT_TRUE(client.getWarnings().empty());
    // Nothing else is enabled, so the project is never scanned.
    EXPECT_EQ(listener.count(EventType::ScanningProject), 0u);
}
