#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <boost/system/error_code.hpp>

namespace rtmpingest {
enum class EventType {
    SESSION_OPENED,
    PUBLISH_STARTED,
    META,
    MEDIA,
    PUBLISH_STOPPED,
    SESSION_CLOSED,
};

enum class MediaKind {
    AUDIO, VIDEO
};

// One outbound notification of a session. Only the fields of its type are set.
struct Event {
    EventType type{ EventType::SESSION_CLOSED };
    // SESSION_OPENED
    std::string app;
    std::optional<std::string> tcUrl;
    // PUBLISH_STARTED, META, MEDIA, PUBLISH_STOPPED
    uint32_t sid{ 0 };
    std::string streamName;
    std::string publishKind;
    // META, MEDIA
    MediaKind kind{ MediaKind::VIDEO };
    uint32_t timestamp{ 0 };
    std::string payload;
    // SESSION_CLOSED, empty on a clean close
    boost::system::error_code reason;

    static Event sessionOpened(std::string app, std::optional<std::string> tcUrl);
    static Event publishStarted(uint32_t sid, std::string streamName, std::string publishKind);
    static Event meta(uint32_t sid, uint32_t timestamp, std::string payload);
    static Event media(uint32_t sid, MediaKind kind, uint32_t timestamp, std::string payload);
    static Event publishStopped(uint32_t sid);
    static Event sessionClosed(boost::system::error_code reason);

    std::string toString() const;
};

// Receives the events of one session. close() is called exactly once, after
// the last push().
class EventSink
{
public:
    virtual ~EventSink() = default;

    virtual void push(Event event) = 0;
    virtual void close(boost::system::error_code reason) = 0;
};
}
