#include <spdlog/spdlog.h>
#include "RtmpSession.hpp"
#include "Error.hpp"

namespace rtmpingest {
RtmpSession::RtmpSession(boost::asio::ip::tcp::socket socket, const Config &config, SessionHooks &hooks,
                         std::shared_ptr<EventChannel> channel)
    : config_(config),
      framer_(std::move(socket), config.readBufferSize, config.maxReadBufferSize),
      channel_(std::move(channel)),
      session_(config, hooks, *channel_, framer_.out()),
      handshakeTimer_(framer_.socket().get_executor()),
      idleTimer_(framer_.socket().get_executor()),
      flushTimer_(framer_.socket().get_executor())
{
}

void RtmpSession::start(CloseHandler onClose)
{
    onClose_ = std::move(onClose);
    SPDLOG_INFO("RTMP session {}, accepted {}, wait handshake", (void *)this, framer_.remote());
    auto self(shared_from_this());
    handshakeTimer_.expires_after(config_.handshakeTimeout);
    handshakeTimer_.async_wait([this, self](const boost::system::error_code & ec) {
        if(!ec && handshaking_ && !stopping_) {
            SPDLOG_ERROR("RTMP session {}, handshake timeout", (void *)this);
            stopSession(Error::timeout);
        }
    });
    doRead();
}

void RtmpSession::stop()
{
    auto self(shared_from_this());
    boost::asio::post(framer_.socket().get_executor(), [this, self]() {
        if(stopping_) {
            return;
        }
        SPDLOG_INFO("RTMP session {}, stopped by server", (void *)this);
        session_.requestReconnect("The server is shutting down.");
        stopSession(boost::system::error_code());
    });
}

void RtmpSession::doRead()
{
    if(stopping_ || paused_ || framer_.reading()) {
        return;
    }
    auto self(shared_from_this());
    framer_.readSome([this, self](const boost::system::error_code & ec, std::size_t length) {
        onRead(ec, length);
    });
}

void RtmpSession::onRead(const boost::system::error_code &ec, std::size_t length)
{
    if(stopping_) {
        return;
    }
    if(ec) {
        if(ec == boost::asio::error::eof && !handshaking_
                && !session_.midMessage() && framer_.in().readableSize() == 0) {
            SPDLOG_INFO("RTMP session {}, peer closed the connection", (void *)this);
            stopSession(boost::system::error_code());
        } else {
            SPDLOG_ERROR("RTMP session {}, read failed: {}", (void *)this, ec.message());
            stopSession(fromTransport(ec));
        }
        return;
    }
    session_.received(length);
    decode();
    if(!handshaking_) {
        armIdleTimer();
    }
}

void RtmpSession::decode()
{
    while(!stopping_) {
        if(!channel_->hasSpace()) {
            SPDLOG_DEBUG("RTMP session {}, event channel full, pause reading", (void *)this);
            paused_ = true;
            auto self(shared_from_this());
            auto executor = framer_.socket().get_executor();
            channel_->waitSpace([this, self, executor]() {
                boost::asio::post(executor, [this, self]() {
                    paused_ = false;
                    if(!stopping_) {
                        decode();
                    }
                });
            });
            break;
        }
        boost::system::error_code ec;
        SessionResult result = session_.process(framer_.in(), ec);
        if(result == SessionResult::ERROR) {
            SPDLOG_ERROR("RTMP session {}, {}, closing", (void *)this, ec.message());
            stopSession(ec);
            return;
        }
        if(handshaking_ && session_.state() != SessionState::HANDSHAKING) {
            handshaking_ = false;
            handshakeTimer_.cancel();
            armIdleTimer();
        }
        if(result == SessionResult::NEED_MORE) {
            break;
        }
    }
    if(stopping_) {
        return;
    }
    flush();
    doRead();
}

void RtmpSession::flush()
{
    if(framer_.out().readableSize() == 0) {
        return;
    }
    auto self(shared_from_this());
    framer_.flush([this, self](const boost::system::error_code & ec) {
        if(ec && !stopping_) {
            SPDLOG_ERROR("RTMP session {}, fail to write: {}", (void *)this, ec.message());
            stopSession(fromTransport(ec));
        }
    });
}

void RtmpSession::armIdleTimer()
{
    if(session_.state() == SessionState::PUBLISHING) {
        idleTimer_.cancel();
        return;
    }
    auto self(shared_from_this());
    idleTimer_.expires_after(config_.idleTimeout);
    idleTimer_.async_wait([this, self](const boost::system::error_code & ec) {
        if(ec || stopping_ || session_.state() == SessionState::PUBLISHING) {
            return;
        }
        SPDLOG_WARN("RTMP session {}, idle for {} ms in state {}", (void *)this,
                    config_.idleTimeout.count(), toString(session_.state()));
        stopSession(Error::timeout);
    });
}

void RtmpSession::stopSession(const boost::system::error_code &reason)
{
    if(stopping_) {
        return;
    }
    stopping_ = true;
    reason_ = reason;
    handshakeTimer_.cancel();
    idleTimer_.cancel();
    // best effort flush of pending replies, bounded by the flush timeout
    auto self(shared_from_this());
    flushTimer_.expires_after(config_.flushTimeout);
    flushTimer_.async_wait([this, self](const boost::system::error_code & ec) {
        if(!ec) {
            SPDLOG_WARN("RTMP session {}, flush timeout", (void *)this);
            closeSession();
        }
    });
    framer_.flush([this, self](const boost::system::error_code &) {
        closeSession();
    });
}

void RtmpSession::closeSession()
{
    if(closed_) {
        return;
    }
    closed_ = true;
    flushTimer_.cancel();
    framer_.close();
    session_.close(reason_);
    SPDLOG_INFO("RTMP session {}, stop and free this session", (void *)this);
    if(onClose_) {
        onClose_(shared_from_this());
    }
}
}
