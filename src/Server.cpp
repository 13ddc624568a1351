#include <spdlog/spdlog.h>
#include "Server.hpp"
#include "RtmpServer.hpp"

namespace rtmpingest {
static void logEvents(std::shared_ptr<EventChannel> channel)
{
    Event event;
    while(channel->pop(event)) {
        if(event.type == EventType::MEDIA || event.type == EventType::META) {
            SPDLOG_DEBUG("Event channel {}, {}", (void *)channel.get(), event.toString());
        } else {
            SPDLOG_INFO("Event channel {}, {}", (void *)channel.get(), event.toString());
        }
    }
}

Server::Server(const Config &config)
    : config_(config),
      io_context_(1)
{
}

Server::~Server()
{
    SPDLOG_INFO("Server exit");
}

void Server::run(const std::string &ip, uint16_t port)
{
    AcceptAllHooks hooks;
    RtmpServer rtmpServer(io_context_, config_, hooks, logEvents);
    boost::asio::signal_set signals(io_context_);
    signals.add(SIGINT);
    signals.add(SIGTERM);
#if defined(SIGQUIT)
    signals.add(SIGQUIT);
#endif
    signals.async_wait(
    [&rtmpServer](const boost::system::error_code & /*ec*/, int signo) {
        SPDLOG_INFO("Stop server by signal {}", signo);
        rtmpServer.stop();
    });
    rtmpServer.start(ip, port);
    io_context_.run();
}

boost::asio::io_context &Server::get_io_context()
{
    return io_context_;
}
}
