#include "lintel/engine/SuppressionResolver.h"
#include "lintel/core/Issue.h"
#include "lintel/core/LintConstants.h"
#include "lintel/model/SourceNode.h"

#include <llvm/ADT/StringRef.h>

namespace lintel::suppression {

namespace {

bool matchesIssue(const Issue *issue, llvm::StringRef id) {
    if (id.equals_insensitive(kSuppressAll))
        return true;
    return issue && id.equals_insensitive(issue->getId());
}

bool isSuppressed(const Issue *issue, const std::vector<AnnotationNode> &annotations) {
    for (const AnnotationNode &annotation : annotations) {
        if (!llvm::StringRef(annotation.desc).endswith(kSuppressLintVmSig))
            continue;

        for (const auto &[key, argument] : annotation.values) {
            if (key != "value")
                continue;
            if (const auto *id = std::get_if<std::string>(&argument)) {
                if (matchesIssue(issue, *id))
                    return true;
            } else if (const auto *ids = std::get_if<std::vector<std::string>>(&argument)) {
                for (const std::string &each : *ids) {
                    if (matchesIssue(issue, each))
                        return true;
                }
            }
        }
    }
    return false;
}

bool isSuppressionAnnotation(llvm::StringRef typeName) {
    return typeName.endswith(kSuppressLint) || typeName.endswith(kSuppressWarnings);
}

bool matchesValue(const Issue *issue, const AnnotationValue &value) {
    if (const auto *literal = std::get_if<StringLiteral>(&value))
        return matchesIssue(issue, literal->value);

    if (const auto *array = std::get_if<ArrayInitializer>(&value)) {
        for (const auto &element : array->elements) {
            if (element && matchesIssue(issue, *element))
                return true;
        }
    }
    return false;
}

bool isSuppressed(const Issue *issue, const Modifiers &modifiers) {
    for (const SourceAnnotation &annotation : modifiers.annotations) {
        if (!isSuppressionAnnotation(annotation.typeName))
            continue;
        for (const SourceAnnotationElement &element : annotation.elements) {
            if (matchesValue(issue, element.value))
                return true;
        }
    }
    return false;
}

} // anonymous namespace

bool isSuppressed(const Issue *issue, const ClassNode &classNode) {
    return isSuppressed(issue, classNode.invisibleAnnotations);
}

bool isSuppressed(const Issue *issue, const MethodNode &method) {
    return isSuppressed(issue, method.invisibleAnnotations);
}

bool isSuppressed(const Issue *issue, const FieldNode &field) {
    return isSuppressed(issue, field.invisibleAnnotations);
}

bool isSuppressed(const Issue *issue, const SourceNode *node) {
    for (; node; node = node->getParent()) {
        switch (node->getKind()) {
            case SourceNode::Kind::VariableDefinition:
            case SourceNode::Kind::MethodDeclaration:
            case SourceNode::Kind::ClassDeclaration:
                if (isSuppressed(issue, node->getModifiers()))
                    return true;
                break;
            default:
                break;
        }
    }
    return false;
}

} // namespace lintel::suppression
