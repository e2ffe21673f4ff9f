#pragma once

#include <algorithm>
#include <string_view>
#include <vector>

namespace lintel {

class Context;
class LintDriver;

enum class EventType {
    Starting,
    ScanningProject,
    ScanningLibraryProject,
    ScanningFile,
    NewPhase,
    Completed,
    Canceled,
};

constexpr std::string_view eventTypeName(EventType type) {
    switch (type) {
        case EventType::Starting:               return "starting";
        case EventType::ScanningProject:        return "scanning-project";
        case EventType::ScanningLibraryProject: return "scanning-library-project";
        case EventType::ScanningFile:           return "scanning-file";
        case EventType::NewPhase:               return "new-phase";
        case EventType::Completed:              return "completed";
        case EventType::Canceled:               return "canceled";
    }
    return "unknown";
}

// Progress observer. `context` is null for Starting, Completed and
// Canceled.
class LintListener {
public:
    virtual ~LintListener() = default;
    virtual void update(LintDriver &driver, EventType type, const Context *context) = 0;
};

// Listeners are notified synchronously, in registration order. The
// notifier does not own them.
class EventNotifier {
public:
    void addListener(LintListener &listener) { listeners_.push_back(&listener); }

    void removeListener(LintListener &listener) {
        listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), &listener),
                         listeners_.end());
    }

    void fire(LintDriver &driver, EventType type, const Context *context) const {
        for (LintListener *listener : listeners_)
            listener->update(driver, type, context);
    }

    bool empty() const { return listeners_.empty(); }

private:
    std::vector<LintListener *> listeners_;
};

} // namespace lintel
