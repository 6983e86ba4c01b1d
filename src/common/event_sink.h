#ifndef SKYVAULT_COMMON_EVENT_SINK_H_
#define SKYVAULT_COMMON_EVENT_SINK_H_

#include <mutex>
#include <string>
#include <vector>

namespace Skyvault {

enum class EventLevel {
    VERBOSE,
    INFO,
    WARNING,
    ERROR
};

const char* EventLevelName(EventLevel level);

/**
 * Destination of diagnostic events emitted by the core components.
 * Components never write to the process-wide logger directly; they are
 * handed a sink by whoever owns them.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void Emit(EventLevel level, const std::string& message) = 0;

    void Verbose(const std::string& message) { Emit(EventLevel::VERBOSE, message); }
    void Info(const std::string& message) { Emit(EventLevel::INFO, message); }
    void Warning(const std::string& message) { Emit(EventLevel::WARNING, message); }
    void Error(const std::string& message) { Emit(EventLevel::ERROR, message); }
};

/**
 * Forwards events to glog. VERBOSE events go to VLOG(1).
 */
class GlogEventSink : public EventSink {
public:
    void Emit(EventLevel level, const std::string& message) override;
};

// Drops everything.
class NullEventSink : public EventSink {
public:
    void Emit(EventLevel, const std::string&) override {}
};

/**
 * Keeps every event in memory, used by tests to assert on diagnostics.
 */
class RecordingEventSink : public EventSink {
public:
    struct Event {
        EventLevel level;
        std::string message;
    };

    void Emit(EventLevel level, const std::string& message) override;

    std::vector<Event> Events() const;
    bool Contains(EventLevel level, const std::string& fragment) const;

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

} // namespace Skyvault

#endif // SKYVAULT_COMMON_EVENT_SINK_H_
