#include "lintel/output/OutputFormatter.h"

#include <sstream>

namespace lintel {

std::string CLIOutputFormatter::format(const std::vector<Warning> &warnings) {
    std::ostringstream os;

    for (const auto &w : warnings) {
        if (!w.file.empty()) {
            os << w.file;
            if (w.line > 0)
                os << ":" << w.line;
            if (w.column > 0)
                os << ":" << w.column;
            os << ": ";
        }

        os << severityToString(w.severity) << ": " << w.message
           << " [" << w.issueId << "]\n";
    }

    if (warnings.empty()) {
        os << "lintel: no issues found.\n";
    } else {
        size_t errors = 0;
        for (const auto &w : warnings) {
            if (w.severity >= Severity::Error)
                ++errors;
        }
        os << "lintel: " << errors << " error(s), " << warnings.size() - errors
           << " warning(s).\n";
    }

    return os.str();
}

} // namespace lintel
