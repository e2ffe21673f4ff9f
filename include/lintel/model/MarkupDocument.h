#pragma once

#include <llvm/ADT/StringRef.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lintel {

// Parsed markup tree handed to the core by the embedding tool's parser.
class MarkupElement {
public:
    explicit MarkupElement(std::string tagName) : tagName_(std::move(tagName)) {}

    llvm::StringRef getTagName() const { return tagName_; }
    const MarkupElement *getParent() const { return parent_; }

    // Empty when the attribute is absent.
    llvm::StringRef getAttribute(llvm::StringRef name) const;
    bool hasAttribute(llvm::StringRef name) const;
    void setAttribute(std::string name, std::string value);

    const std::vector<std::pair<std::string, std::string>> &attributes() const {
        return attributes_;
    }

    MarkupElement &appendChild(std::string tagName);
    const std::vector<std::unique_ptr<MarkupElement>> &children() const {
        return children_;
    }

    unsigned line = 0;
    unsigned column = 0;

private:
    std::string tagName_;
    const MarkupElement *parent_ = nullptr;
    std::vector<std::pair<std::string, std::string>> attributes_;
    std::vector<std::unique_ptr<MarkupElement>> children_;
};

struct MarkupDocument {
    std::string path;
    std::unique_ptr<MarkupElement> root;
};

} // namespace lintel
