#pragma once

#include <llvm/ADT/ArrayRef.h>

#include <utility>
#include <vector>

namespace lintel {

class Context;
class Detector;
class SourceParser;

// Runs a list of source scanners over each compilation unit.
class SourceVisitor {
public:
    SourceVisitor(SourceParser &parser, std::vector<Detector *> detectors)
        : parser_(parser), detectors_(std::move(detectors)) {}

    // Parses the file behind `context` and visits it. Files the parser
    // rejects are skipped.
    void visitFile(const Context &context);

    llvm::ArrayRef<Detector *> getDetectors() const { return detectors_; }

private:
    SourceParser &parser_;
    std::vector<Detector *> detectors_;
};

} // namespace lintel
