#pragma once

#include "lintel/project/ResourceFolderType.h"

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lintel {

class ClassContext;
class Context;
class MarkupElement;
class SourceContext;
class SourceNode;
class XmlContext;
struct ClassNode;
struct MarkupDocument;

// Which artifact representations a detector knows how to scan. The
// dispatcher only hands a detector the representations it declares.
enum Capability : uint8_t {
    kNoCapability = 0,
    kMarkupScanner = 1 << 0,
    kSourceScanner = 1 << 1,
    kClassScanner  = 1 << 2,
};

// Pluggable check. One instance serves every issue bound to its kind and
// lives for all phases of one project, so state gathered in an early phase
// is available in a repeated one.
class Detector {
public:
    virtual ~Detector() = default;

    // Identifies the implementation; issues bind to detectors by kind.
    virtual std::string_view getKind() const = 0;
    virtual uint8_t getCapabilities() const { return kNoCapability; }
    bool hasCapability(Capability c) const { return (getCapabilities() & c) != 0; }

    virtual void beforeCheckProject(const Context &) {}
    virtual void afterCheckProject(const Context &) {}
    virtual void beforeCheckLibraryProject(const Context &) {}
    virtual void afterCheckLibraryProject(const Context &) {}
    virtual void beforeCheckFile(const Context &) {}
    virtual void afterCheckFile(const Context &) {}

    virtual bool appliesTo(const Context &, llvm::StringRef /*file*/) { return true; }
    virtual bool appliesTo(ResourceFolderType) { return true; }

    // Entry point for files without a parsed representation.
    virtual void run(const Context &) {}

    // Markup scanners. An empty element list means the detector only wants
    // visitDocument; kAllElements selects every element.
    static constexpr std::string_view kAllElements = "*";
    virtual std::vector<std::string> getApplicableElements() const { return {}; }
    virtual void visitDocument(const XmlContext &, const MarkupDocument &) {}
    virtual void visitElement(const XmlContext &, const MarkupElement &) {}

    // Source scanners.
    virtual void visitSourceUnit(const SourceContext &, const SourceNode &) {}

    // Class scanners.
    virtual void checkClass(const ClassContext &, const ClassNode &) {}
};

} // namespace lintel
