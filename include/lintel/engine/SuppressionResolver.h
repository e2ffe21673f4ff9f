#pragma once

#include "lintel/model/ClassNode.h"

#include <vector>

namespace lintel {

class Issue;
class SourceNode;

// Answers whether a class member or a syntax node carries a SuppressLint
// (or, in source, SuppressWarnings) annotation covering an issue. A null
// issue matches only the "all" wildcard.
namespace suppression {

bool isSuppressed(const Issue *issue, const ClassNode &classNode);
bool isSuppressed(const Issue *issue, const MethodNode &method);
bool isSuppressed(const Issue *issue, const FieldNode &field);

// Walks from `node` up through its enclosing variable, method and class
// declarations.
bool isSuppressed(const Issue *issue, const SourceNode *node);

} // namespace suppression

} // namespace lintel
