#pragma once

#include <llvm/ADT/StringRef.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lintel {

// Value of a source annotation element: a string literal, an array
// initializer, or some other expression the core never interprets.
// Array members that are not string literals are std::nullopt.
struct StringLiteral {
    std::string value;
};

struct ArrayInitializer {
    std::vector<std::optional<std::string>> elements;
};

using AnnotationValue = std::variant<std::monostate, StringLiteral, ArrayInitializer>;

struct SourceAnnotationElement {
    std::string name;               // empty for the implicit "value"
    AnnotationValue value;
};

struct SourceAnnotation {
    std::string typeName;           // as written, possibly qualified
    std::vector<SourceAnnotationElement> elements;
};

struct Modifiers {
    std::vector<SourceAnnotation> annotations;
};

// Syntax tree node produced by the source parser. Only declaration kinds
// carry modifiers; every node knows its parent.
class SourceNode {
public:
    enum class Kind {
        CompilationUnit,
        ClassDeclaration,
        MethodDeclaration,
        VariableDefinition,
        Block,
        Statement,
        Expression,
    };

    SourceNode(Kind kind, std::string name = {})
        : kind_(kind), name_(std::move(name)) {}

    Kind getKind() const { return kind_; }
    llvm::StringRef getName() const { return name_; }
    const SourceNode *getParent() const { return parent_; }

    const Modifiers &getModifiers() const { return modifiers_; }
    Modifiers &getModifiers() { return modifiers_; }

    SourceNode &appendChild(Kind kind, std::string name = {});
    const std::vector<std::unique_ptr<SourceNode>> &children() const {
        return children_;
    }

    unsigned line = 0;
    unsigned column = 0;

private:
    Kind kind_;
    std::string name_;
    const SourceNode *parent_ = nullptr;
    Modifiers modifiers_;
    std::vector<std::unique_ptr<SourceNode>> children_;
};

} // namespace lintel
