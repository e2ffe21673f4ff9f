#include "TestSupport.h"

#include "lintel/project/Project.h"

#include <algorithm>

using namespace lintel;
using namespace lintel::test;

class LintDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        client.sourceParser = &sourceParser;
        app = tree.makeProject("app");
        tree.write("app/src/com/example/Foo.java", "class Foo {}\n");
    }

    // Registers the "src" source scanner with one issue.
    const Issue &addSourceCheck(std::function<void(RecordingDetector &)> configure = {}) {
        const Issue &issue = test.addIssue("SourceCheck", "src", scopes::kSourceFile);
        test.addDetector("src", kSourceScanner, std::move(configure));
        return issue;
    }

    void analyze(std::vector<std::string> paths,
                 std::optional<ScopeSet> scope = std::nullopt) {
        driver = std::make_unique<LintDriver>(test.registry, client);
        driver->addLintListener(listener);
        driver->analyze(paths, scope);
    }

    TempTree tree;
    FakeClient client;
    FakeSourceParser sourceParser;
    TestRegistry test;
    RecordingListener listener;
    std::unique_ptr<LintDriver> driver;
    std::string app;
};

TEST_F(LintDriverTest, EventOrder) {
    addSourceCheck();
    analyze({app});

    EXPECT_EQ(listener.events, (std::vector<std::string>{
                                   "starting",
                                   "scanning-project:app",
                                   "scanning-file:Foo.java",
                                   "completed",
                               }));
    EXPECT_EQ(test.events, (std::vector<std::string>{
                               "src:beforeCheckProject:app",
                               "src:visitSourceUnit:Foo.java",
                               "src:afterCheckProject:app",
                           }));
}

TEST_F(LintDriverTest, NoProjectsFound) {
    addSourceCheck();
    std::string empty = tree.mkdir("empty");
    analyze({empty});

    EXPECT_TRUE(client.logged("No projects found for " + empty));
    EXPECT_TRUE(listener.events.empty());
}

TEST_F(LintDriverTest, ProjectWithoutEnabledDetectorsIsSkipped) {
    addSourceCheck();
    client.configuration.setSeverity("SourceCheck", Severity::Ignore);
    analyze({app});

    EXPECT_EQ(listener.events, (std::vector<std::string>{"starting", "completed"}));
    EXPECT_TRUE(test.events.empty());
}

TEST_F(LintDriverTest, RepeatRunsSecondPhaseWithSameInstance) {
    std::vector<std::pair<int, ScopeSet>> passes;
    addSourceCheck([&](RecordingDetector &detector) {
        detector.onBeforeProject = [&](RecordingDetector &self, const Context &context) {
            passes.emplace_back(context.getPhase(), context.getScope());
            if (context.getPhase() == 1)
                context.requestRepeat(self);
        };
    });
    analyze({app}, ScopeSet::all());

    ASSERT_EQ(passes.size(), 2u);
    EXPECT_EQ(passes[1].first, 2);
    EXPECT_TRUE(passes[1].second == ScopeSet::all());
    EXPECT_EQ(test.created["src"], 1);
    EXPECT_EQ(countPrefix(test.events, "src:visitSourceUnit"), 2u);

    auto newPhase = std::find(listener.events.begin(), listener.events.end(), "new-phase:app");
    ASSERT_NE(newPhase, listener.events.end());
    EXPECT_EQ(listener.phases[newPhase - listener.events.begin()], 2);
    EXPECT_EQ(listener.events.back(), "completed");
}

TEST_F(LintDriverTest, RepeatsAreCappedAtThreePhases) {
    std::vector<int> phases;
    addSourceCheck([&](RecordingDetector &detector) {
        detector.onBeforeProject = [&](RecordingDetector &self, const Context &context) {
            phases.push_back(context.getPhase());
            context.requestRepeat(self);
        };
    });
    analyze({app});

    EXPECT_EQ(phases, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(listener.count(EventType::NewPhase), 2u);
    EXPECT_EQ(listener.count(EventType::Completed), 1u);
}

TEST_F(LintDriverTest, RepeatScopeNarrowsOnlyThatPhase) {
    std::vector<ScopeSet> seen;
    addSourceCheck([&](RecordingDetector &detector) {
        detector.onBeforeProject = [&](RecordingDetector &self, const Context &context) {
            seen.push_back(context.getScope());
            if (context.getPhase() == 1)
                context.requestRepeat(self, scopes::kManifest);
        };
    });
    analyze({app}, ScopeSet::all());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[1] == scopes::kManifest);
    // Sources are outside the narrowed scope.
    EXPECT_EQ(countPrefix(test.events, "src:visitSourceUnit"), 1u);
    EXPECT_TRUE(driver->getScope() == ScopeSet::all());
}

TEST_F(LintDriverTest, CancelStopsTheRun) {
    tree.write("app/src/com/example/Bar.java", "class Bar {}\n");
    tree.makeProject("other");
    tree.write("other/src/Other.java", "class Other {}\n");
    addSourceCheck([](RecordingDetector &detector) {
        detector.onFile = [](RecordingDetector &, const Context &context) {
            context.getDriver().cancel();
        };
    });
    analyze({app, tree.path("other")});

    ASSERT_EQ(client.reports.size(), 1u);
    EXPECT_EQ(client.reports[0].issueId, "Lint");
    EXPECT_EQ(client.reports[0].message, "Lint canceled by user");

    EXPECT_EQ(listener.count(EventType::ScanningFile), 1u);
    EXPECT_EQ(listener.count(EventType::ScanningProject), 1u);
    EXPECT_EQ(listener.count(EventType::Canceled), 1u);
    EXPECT_EQ(listener.count(EventType::Completed), 0u);
    EXPECT_EQ(countPrefix(test.events, "src:afterCheckProject"), 0u);
    EXPECT_TRUE(driver->isCanceled());
}

TEST_F(LintDriverTest, CancelNoticeIgnoresConfiguration) {
    client.configuration.setSeverity("all", Severity::Ignore);
    client.configuration.setSeverity("SourceCheck", Severity::Warning);
    addSourceCheck([](RecordingDetector &detector) {
        detector.onBeforeProject = [](RecordingDetector &, const Context &context) {
            context.getDriver().cancel();
        };
    });
    analyze({app});

    ASSERT_EQ(client.reports.size(), 1u);
    EXPECT_EQ(client.reports[0].issueId, "Lint");
    EXPECT_EQ(listener.count(EventType::ScanningFile), 0u);
}

TEST_F(LintDriverTest, LibrariesAreCheckedOnBehalfOfTheMainProject) {
    tree.makeProject("lib", "com.example.lib");
    tree.write("lib/project.properties", "android.library=true\n");
    tree.write("lib/src/Lib.java", "class Lib {}\n");
    tree.write("app/project.properties", "android.library.reference.1=../lib\n");

    std::vector<std::string> mains;
    addSourceCheck([&](RecordingDetector &detector) {
        detector.onFile = [&](RecordingDetector &, const Context &context) {
            if (context.isLibraryScan())
                mains.push_back(context.getMainProject().getName().str());
        };
    });
    analyze({app});

    EXPECT_EQ(test.events, (std::vector<std::string>{
                               "src:beforeCheckProject:app",
                               "src:visitSourceUnit:Foo.java",
                               "src:beforeCheckLibraryProject:app",
                               "src:visitSourceUnit:Lib.java",
                               "src:afterCheckLibraryProject:app",
                               "src:afterCheckProject:app",
                           }));
    EXPECT_EQ(mains, (std::vector<std::string>{"app"}));
    EXPECT_EQ(listener.count(EventType::ScanningLibraryProject), 1u);
}

TEST_F(LintDriverTest, SingleFileScopeSkipsLibraries) {
    tree.makeProject("lib", "com.example.lib");
    tree.write("lib/src/Lib.java", "class Lib {}\n");
    tree.write("app/project.properties", "android.library.reference.1=../lib\n");
    addSourceCheck();

    analyze({tree.path("app/src/com/example/Foo.java")});

    EXPECT_EQ(listener.count(EventType::ScanningLibraryProject), 0u);
    EXPECT_EQ(countPrefix(test.events, "src:visitSourceUnit"), 1u);
    EXPECT_EQ(countPrefix(test.events, "src:beforeCheckLibraryProject"), 0u);
}

TEST_F(LintDriverTest, NamedSourceFileChecksWholeSourceFolder) {
    tree.write("app/src/com/example/Bar.java", "class Bar {}\n");
    addSourceCheck();

    analyze({tree.path("app/src/com/example/Foo.java")});

    EXPECT_EQ(countPrefix(test.events, "src:visitSourceUnit:Bar.java"), 1u);
    EXPECT_EQ(countPrefix(test.events, "src:visitSourceUnit:Foo.java"), 1u);
    EXPECT_EQ(listener.count(EventType::ScanningFile), 2u);
}

TEST_F(LintDriverTest, DisabledIssueReportedByDetectorIsDropped) {
    const Issue &other = test.addIssue("OtherCheck", "unused", scopes::kSourceFile);
    client.configuration.setSeverity("OtherCheck", Severity::Ignore);
    const Issue *enabled = nullptr;
    enabled = &addSourceCheck([&](RecordingDetector &detector) {
        detector.onFile = [&](RecordingDetector &, const Context &context) {
            context.report(other, std::nullopt, "should not appear");
            context.report(*enabled, std::nullopt, "kept");
        };
    });
    analyze({app});

    ASSERT_EQ(client.reports.size(), 1u);
    EXPECT_EQ(client.reports[0].issueId, "SourceCheck");
    EXPECT_EQ(client.reports[0].message, "kept");
    EXPECT_TRUE(client.logged("Incorrect detector reported disabled issue OtherCheck"));
}
