#pragma once

#include "lintel/model/ClassNode.h"
#include "lintel/model/MarkupDocument.h"
#include "lintel/model/SourceNode.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <memory>

namespace lintel {

class Context;

// Parsers are supplied by the embedding tool; the core only sequences
// calls into them. A parser that cannot make sense of a file reports the
// problem itself (typically as the ParserError issue) and returns null.

class MarkupParser {
public:
    virtual ~MarkupParser() = default;
    virtual std::unique_ptr<MarkupDocument> parse(const Context &context) = 0;
};

class SourceParser {
public:
    virtual ~SourceParser() = default;
    virtual std::unique_ptr<SourceNode> parse(const Context &context) = 0;
};

class ClassReader {
public:
    virtual ~ClassReader() = default;
    virtual llvm::Expected<std::unique_ptr<ClassNode>>
    read(llvm::ArrayRef<uint8_t> bytes) = 0;
};

} // namespace lintel
