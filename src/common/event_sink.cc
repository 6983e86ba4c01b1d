#include "event_sink.h"

#include <glog/logging.h>

namespace Skyvault {

const char* EventLevelName(EventLevel level) {
    switch (level) {
        case EventLevel::VERBOSE:
            return "VERBOSE";
        case EventLevel::INFO:
            return "INFO";
        case EventLevel::WARNING:
            return "WARNING";
        case EventLevel::ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

void GlogEventSink::Emit(EventLevel level, const std::string& message) {
    switch (level) {
        case EventLevel::VERBOSE:
            VLOG(1) << message;
            break;
        case EventLevel::INFO:
            LOG(INFO) << message;
            break;
        case EventLevel::WARNING:
            LOG(WARNING) << message;
            break;
        case EventLevel::ERROR:
            LOG(ERROR) << message;
            break;
    }
}

void RecordingEventSink::Emit(EventLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(Event{level, message});
}

std::vector<RecordingEventSink::Event> RecordingEventSink::Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

bool RecordingEventSink::Contains(EventLevel level, const std::string& fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& event : events_) {
        if (event.level == level && event.message.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace Skyvault
