#include "lintel/output/OutputFormatter.h"

#include <gtest/gtest.h>

using namespace lintel;

namespace {

Warning makeWarning(std::string file, unsigned line, Severity severity, std::string message) {
    Warning w;
    w.issueId = "WrongKeep";
    w.category = "Correctness";
    w.priority = 8;
    w.severity = severity;
    w.project = "app";
    w.file = std::move(file);
    w.line = line;
    w.column = 4;
    w.message = std::move(message);
    return w;
}

} // anonymous namespace

TEST(CLIOutputTest, EmptyRun) {
    CLIOutputFormatter formatter;
    EXPECT_EQ(formatter.format({}), "lintel: no issues found.\n");
}

TEST(CLIOutputTest, LinesAndSummary) {
    CLIOutputFormatter formatter;
    std::string out = formatter.format({
        makeWarning("app/proguard.cfg", 2, Severity::Fatal, "Obsolete rule"),
        makeWarning("", 0, Severity::Warning, "Project wide"),
    });

    EXPECT_NE(out.find("app/proguard.cfg:2:4: fatal: Obsolete rule [WrongKeep]\n"),
              std::string::npos);
    EXPECT_NE(out.find("\nwarning: Project wide [WrongKeep]\n"), std::string::npos);
    EXPECT_NE(out.find("lintel: 1 error(s), 1 warning(s).\n"), std::string::npos);
}

TEST(JSONOutputTest, EscapesStrings) {
    JSONOutputFormatter formatter;
    std::string out = formatter.format({
        makeWarning("dir\\file.cfg", 1, Severity::Error, "say \"hi\"\n\x01"),
    });

    EXPECT_NE(out.find("\"file\": \"dir\\\\file.cfg\""), std::string::npos);
    EXPECT_NE(out.find("\"message\": \"say \\\"hi\\\"\\n\\u0001\""), std::string::npos);
    EXPECT_NE(out.find("\"severity\": \"error\""), std::string::npos);
    EXPECT_NE(out.find("\"version\": "), std::string::npos);
}

TEST(JSONOutputTest, EmptyList) {
    JSONOutputFormatter formatter;
    std::string out = formatter.format({});
    EXPECT_NE(out.find("\"warnings\": [\n  ]"), std::string::npos);
}
