#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lintel {

// Structural view of a compiled class as produced by the embedding tool's
// bytecode reader. Only what the core and class scanners look at is kept.

// An annotation argument: a string, a list of strings, or anything else.
using AnnotationArgument =
    std::variant<std::monostate, std::string, std::vector<std::string>>;

struct AnnotationNode {
    std::string desc;   // type descriptor, e.g. "Landroid/annotation/SuppressLint;"
    std::vector<std::pair<std::string, AnnotationArgument>> values;
};

struct MethodNode {
    std::string name;
    std::string desc;
    unsigned access = 0;
    std::vector<AnnotationNode> invisibleAnnotations;
};

struct FieldNode {
    std::string name;
    std::string desc;
    unsigned access = 0;
    std::vector<AnnotationNode> invisibleAnnotations;
};

struct ClassNode {
    std::string name;           // internal name, e.g. "com/example/Foo"
    std::string superName;
    std::string sourceFile;
    unsigned access = 0;
    std::vector<AnnotationNode> invisibleAnnotations;
    std::vector<MethodNode> methods;
    std::vector<FieldNode> fields;
};

} // namespace lintel
