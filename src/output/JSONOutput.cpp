#include "lintel/core/Version.h"
#include "lintel/output/OutputFormatter.h"

#include <cstdio>
#include <sstream>

namespace lintel {

namespace {

std::string escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<Warning> &warnings) {
    std::ostringstream os;
    os << "{\n  \"version\": \"" << kToolVersion << "\",\n  \"warnings\": [\n";

    for (size_t i = 0; i < warnings.size(); ++i) {
        const auto &w = warnings[i];
        os << "    {\n";
        os << "      \"id\": \"" << escape(w.issueId) << "\",\n";
        os << "      \"category\": \"" << escape(w.category) << "\",\n";
        os << "      \"priority\": " << w.priority << ",\n";
        os << "      \"severity\": \"" << severityToString(w.severity) << "\",\n";
        os << "      \"project\": \"" << escape(w.project) << "\",\n";
        os << "      \"location\": {\n";
        os << "        \"file\": \"" << escape(w.file) << "\",\n";
        os << "        \"line\": " << w.line << ",\n";
        os << "        \"column\": " << w.column << "\n";
        os << "      },\n";
        os << "      \"message\": \"" << escape(w.message) << "\"\n";
        os << "    }";
        if (i + 1 < warnings.size()) os << ",";
        os << "\n";
    }

    os << "  ]\n}\n";
    return os.str();
}

} // namespace lintel
