#include "lintel/model/MarkupDocument.h"

#include <algorithm>

namespace lintel {

llvm::StringRef MarkupElement::getAttribute(llvm::StringRef name) const {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [name](const auto &a) { return a.first == name; });
    return it != attributes_.end() ? llvm::StringRef(it->second)
                                   : llvm::StringRef();
}

bool MarkupElement::hasAttribute(llvm::StringRef name) const {
    return std::any_of(attributes_.begin(), attributes_.end(),
                       [name](const auto &a) { return a.first == name; });
}

void MarkupElement::setAttribute(std::string name, std::string value) {
    for (auto &a : attributes_) {
        if (a.first == name) {
            a.second = std::move(value);
            return;
        }
    }
    attributes_.emplace_back(std::move(name), std::move(value));
}

MarkupElement &MarkupElement::appendChild(std::string tagName) {
    children_.push_back(std::make_unique<MarkupElement>(std::move(tagName)));
    children_.back()->parent_ = this;
    return *children_.back();
}

} // namespace lintel
