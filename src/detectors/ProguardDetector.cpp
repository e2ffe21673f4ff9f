#include "lintel/core/Detector.h"
#include "lintel/core/IssueRegistry.h"
#include "lintel/client/Client.h"
#include "lintel/engine/Context.h"
#include "lintel/engine/LintDriver.h"

#include <llvm/ADT/StringRef.h>

namespace lintel {

// Looks for the keep rule that old project templates generated for custom
// views. `-keepclasseswithmembernames` only protects the names of members
// that survive shrinking, so the constructors the layout inflater calls
// reflectively may still be removed.
class ProguardDetector : public Detector {
public:
    static constexpr std::string_view kKind = "proguard";

    static const Issue &wrongKeep() {
        static const Issue issue(
            "WrongKeep", "Looks for problems in proguard config files",
            "Using `-keepclasseswithmembernames` in a proguard config file is not "
            "correct; it can cause some symbols to be renamed which should not be. "
            "Earlier versions of the project templates generated this rule for "
            "view constructors taking a Context. Use `-keepclasseswithmembers` "
            "instead.",
            Category::correctness(), 8, Severity::Fatal, std::string(kKind),
            scopes::kProguardFile);
        return issue;
    }

    static std::vector<const Issue *> getIssues() { return {&wrongKeep()}; }

    std::string_view getKind() const override { return kKind; }

    void run(const Context &context) override {
        auto contents = context.getContents();
        if (!contents) {
            context.getDriver().getClient().log(
                llvm::errorCodeToError(contents.getError()),
                "Could not read " + context.getFile());
            return;
        }

        llvm::StringRef text = *contents;
        static constexpr llvm::StringLiteral kDirective("-keepclasseswithmembernames");
        size_t pos = text.find(kDirective);
        while (pos != llvm::StringRef::npos) {
            size_t open = text.find('{', pos);
            size_t close = text.find('}', open);
            llvm::StringRef body = text.slice(open, close);
            if (open != llvm::StringRef::npos && body.contains("<init>(android.")) {
                unsigned line = 1 + static_cast<unsigned>(text.take_front(pos).count('\n'));
                size_t lineStart = text.rfind('\n', pos);
                unsigned column = lineStart == llvm::StringRef::npos
                                      ? static_cast<unsigned>(pos)
                                      : static_cast<unsigned>(pos - lineStart - 1);
                context.report(wrongKeep(), Location::create(context.getFile(), line, column),
                               "Obsolete ProGuard file; use -keepclasseswithmembers "
                               "instead of -keepclasseswithmembernames");
            }
            pos = text.find(kDirective, pos + kDirective.size());
        }
    }
};

LINTEL_REGISTER_DETECTOR(ProguardDetector)

} // namespace lintel
