#include "lintel/engine/MarkupVisitor.h"
#include "lintel/client/Parsers.h"
#include "lintel/core/Detector.h"
#include "lintel/engine/Context.h"

namespace lintel {

MarkupVisitor::MarkupVisitor(MarkupParser &parser, std::vector<Detector *> detectors)
    : parser_(parser), detectors_(std::move(detectors)) {
    for (Detector *detector : detectors_) {
        std::vector<std::string> elements = detector->getApplicableElements();
        if (elements.empty()) {
            documentDetectors_.push_back(detector);
            continue;
        }

        for (const std::string &element : elements) {
            if (element == Detector::kAllElements) {
                allElementDetectors_.push_back(detector);
                break;
            }
            elementDetectors_[element].push_back(detector);
        }
    }
}

void MarkupVisitor::visitFile(const Context &context,
                              std::optional<ResourceFolderType> folderType) {
    std::unique_ptr<MarkupDocument> document = parser_.parse(context);
    if (!document)
        return;

    visitDocument(XmlContext(context, *document, folderType));
}

void MarkupVisitor::visitDocument(const XmlContext &context) {
    for (Detector *detector : detectors_)
        detector->beforeCheckFile(context);

    const MarkupDocument &document = context.getDocument();
    for (Detector *detector : documentDetectors_)
        detector->visitDocument(context, document);

    if (document.root && (!elementDetectors_.empty() || !allElementDetectors_.empty()))
        visitElement(context, *document.root);

    for (Detector *detector : detectors_)
        detector->afterCheckFile(context);
}

void MarkupVisitor::visitElement(const XmlContext &context, const MarkupElement &element) {
    auto it = elementDetectors_.find(element.getTagName());
    if (it != elementDetectors_.end()) {
        for (Detector *detector : it->second)
            detector->visitElement(context, element);
    }
    for (Detector *detector : allElementDetectors_)
        detector->visitElement(context, element);

    for (const auto &child : element.children())
        visitElement(context, *child);
}

} // namespace lintel
