#include <utility>
#include <spdlog/fmt/fmt.h>
#include "Event.hpp"
#include "Error.hpp"

namespace rtmpingest {
Event Event::sessionOpened(std::string app, std::optional<std::string> tcUrl)
{
    Event e;
    e.type = EventType::SESSION_OPENED;
    e.app = std::move(app);
    e.tcUrl = std::move(tcUrl);
    return e;
}

Event Event::publishStarted(uint32_t sid, std::string streamName, std::string publishKind)
{
    Event e;
    e.type = EventType::PUBLISH_STARTED;
    e.sid = sid;
    e.streamName = std::move(streamName);
    e.publishKind = std::move(publishKind);
    return e;
}

Event Event::meta(uint32_t sid, uint32_t timestamp, std::string payload)
{
    Event e;
    e.type = EventType::META;
    e.sid = sid;
    e.timestamp = timestamp;
    e.payload = std::move(payload);
    return e;
}

Event Event::media(uint32_t sid, MediaKind kind, uint32_t timestamp, std::string payload)
{
    Event e;
    e.type = EventType::MEDIA;
    e.sid = sid;
    e.kind = kind;
    e.timestamp = timestamp;
    e.payload = std::move(payload);
    return e;
}

Event Event::publishStopped(uint32_t sid)
{
    Event e;
    e.type = EventType::PUBLISH_STOPPED;
    e.sid = sid;
    return e;
}

Event Event::sessionClosed(boost::system::error_code reason)
{
    Event e;
    e.type = EventType::SESSION_CLOSED;
    e.reason = reason;
    return e;
}

std::string Event::toString() const
{
    switch(type) {
    case EventType::SESSION_OPENED:
        return fmt::format("SessionOpened app={} tcUrl={}", app, tcUrl ? *tcUrl : "-");
    case EventType::PUBLISH_STARTED:
        return fmt::format("PublishStarted sid={} name={} kind={}", sid, streamName, publishKind);
    case EventType::META:
        return fmt::format("Meta sid={} ts={} size={}", sid, timestamp, payload.size());
    case EventType::MEDIA:
        return fmt::format("Media sid={} kind={} ts={} size={}", sid,
                           kind == MediaKind::AUDIO ? "audio" : "video", timestamp, payload.size());
    case EventType::PUBLISH_STOPPED:
        return fmt::format("PublishStopped sid={}", sid);
    case EventType::SESSION_CLOSED:
        return fmt::format("SessionClosed reason={}", errorKind(reason));
    }
    return "Unknown";
}
}
