#pragma once

#include "lintel/project/ResourceFolderType.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringMap.h>

#include <optional>
#include <vector>

namespace lintel {

class Context;
class Detector;
class MarkupElement;
class MarkupParser;
class XmlContext;

// Runs a fixed list of markup scanners over parsed documents. Building the
// element index is the costly part, so callers keep one visitor for as
// long as the detector list stays the same.
class MarkupVisitor {
public:
    MarkupVisitor(MarkupParser &parser, std::vector<Detector *> detectors);

    // Parses the file behind `context` and visits it. Files the parser
    // rejects are skipped.
    void visitFile(const Context &context, std::optional<ResourceFolderType> folderType);

    void visitDocument(const XmlContext &context);

    llvm::ArrayRef<Detector *> getDetectors() const { return detectors_; }

private:
    void visitElement(const XmlContext &context, const MarkupElement &element);

    MarkupParser &parser_;
    std::vector<Detector *> detectors_;
    std::vector<Detector *> documentDetectors_;
    std::vector<Detector *> allElementDetectors_;
    llvm::StringMap<std::vector<Detector *>> elementDetectors_;
};

} // namespace lintel
