#include "lintel/model/SourceNode.h"

namespace lintel {

SourceNode &SourceNode::appendChild(Kind kind, std::string name) {
    children_.push_back(std::make_unique<SourceNode>(kind, std::move(name)));
    children_.back()->parent_ = this;
    return *children_.back();
}

} // namespace lintel
