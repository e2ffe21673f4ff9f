#pragma once

#include "lintel/core/Severity.h"

#include <string>
#include <vector>

namespace lintel {

// A finding as collected by the command-line client.
struct Warning {
    std::string issueId;
    std::string category;
    int priority = 0;
    Severity severity = Severity::Warning;
    std::string project;
    std::string file;       // empty when the finding has no location
    unsigned line = 0;
    unsigned column = 0;
    std::string message;
};

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<Warning> &warnings) = 0;
};

class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Warning> &warnings) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Warning> &warnings) override;
};

} // namespace lintel
