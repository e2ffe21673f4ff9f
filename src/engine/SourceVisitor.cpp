#include "lintel/engine/SourceVisitor.h"
#include "lintel/client/Parsers.h"
#include "lintel/core/Detector.h"
#include "lintel/engine/Context.h"

namespace lintel {

void SourceVisitor::visitFile(const Context &context) {
    std::unique_ptr<SourceNode> unit = parser_.parse(context);
    if (!unit)
        return;

    SourceContext sourceContext(context, *unit);
    for (Detector *detector : detectors_)
        detector->beforeCheckFile(sourceContext);
    for (Detector *detector : detectors_)
        detector->visitSourceUnit(sourceContext, *unit);
    for (Detector *detector : detectors_)
        detector->afterCheckFile(sourceContext);
}

} // namespace lintel
