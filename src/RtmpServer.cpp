#include <spdlog/spdlog.h>
#include "RtmpServer.hpp"

namespace rtmpingest {
RtmpServer::RtmpServer(boost::asio::io_context &io, const Config &config, SessionHooks &hooks, ConsumerFn consumer)
    : io_(io),
      config_(config),
      hooks_(hooks),
      consumer_(std::move(consumer)),
      acceptor_(io)
{
}

RtmpServer::~RtmpServer()
{
    for(auto &c : connections_) {
        c.second.consumer.channel->shutdown();
        closing_.push_back(std::move(c.second.consumer));
    }
    connections_.clear();
    // closed channels end on their own once drained
    for(auto &c : closing_) {
        if(c.thread.joinable()) {
            c.thread.join();
        }
    }
}

void RtmpServer::start(const std::string &ip, uint16_t port)
{
    boost::asio::ip::tcp::resolver resolver(io_);
    boost::asio::ip::tcp::endpoint endpoint = *resolver.resolve(ip, std::to_string(port)).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
#if (defined(unix) || defined(__unix) || defined(__unix__) || defined(__APPLE__)) && !defined(__CYGWIN__)
    typedef boost::asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT> reuse_port;
    acceptor_.set_option(reuse_port(true));
#endif
    acceptor_.bind(endpoint);
    acceptor_.listen();
    SPDLOG_INFO("RTMP server listening ({}:{})", ip, this->port());
    doAccept();
}

void RtmpServer::stop()
{
    SPDLOG_INFO("Stop RTMP server, close all clients");
    boost::system::error_code ec;
    acceptor_.close(ec);
    for(auto &c : connections_) {
        c.second.session->stop();
    }
}

uint16_t RtmpServer::port() const
{
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void RtmpServer::doAccept()
{
    acceptor_.async_accept(
    [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
        if(!acceptor_.is_open()) {
            SPDLOG_DEBUG("RTMP server is closed, ignore new clients");
            return;
        }
        reap();
        if(!ec) {
            auto channel = std::make_shared<EventChannel>(config_.outboundChannelCapacity);
            auto c = std::make_shared<RtmpSession>(std::move(socket), config_, hooks_, channel);
            Connection &connection = connections_[c.get()];
            connection.session = c;
            connection.consumer.channel = channel;
            connection.consumer.done = std::make_shared<std::atomic<bool>>(false);
            connection.consumer.thread = std::thread([consumer = consumer_, channel, done = connection.consumer.done] {
                consumer(channel);
                *done = true;
            });
            c->start([this](std::shared_ptr<RtmpSession> s) {
                onClosed(s);
            });
        } else {
            SPDLOG_ERROR("RTMP server, accept failed: {}", ec.message());
        }
        doAccept();
    });
}

void RtmpServer::onClosed(std::shared_ptr<RtmpSession> c)
{
    SPDLOG_INFO("RTMP client {} is closed", (void *)c.get());
    auto it = connections_.find(c.get());
    if(it == connections_.end()) {
        return;
    }
    // the channel is closed, the consumer ends after SessionClosed. It may
    // still be draining, so it is joined later and never on the io thread.
    closing_.push_back(std::move(it->second.consumer));
    connections_.erase(it);
    reap();
}

void RtmpServer::reap()
{
    for(auto it = closing_.begin(); it != closing_.end();) {
        if(*it->done) {
            it->thread.join();
            it = closing_.erase(it);
        } else {
            ++it;
        }
    }
}
}
