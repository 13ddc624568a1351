#include <algorithm>
#include <spdlog/spdlog.h>
#include "Framer.hpp"

namespace rtmpingest {
Framer::Framer(boost::asio::ip::tcp::socket socket, uint32_t readBufferSize, uint32_t maxReadBufferSize)
    : socket_(std::move(socket)),
      readBufferSize_(readBufferSize),
      maxReadBufferSize_(std::max(readBufferSize, maxReadBufferSize)),
      in_(readBufferSize),
      out_(4096),
      outFlush_(4096)
{
}

void Framer::readExact(std::size_t n, ReadHandler handler)
{
    if(in_.readableSize() >= n) {
        boost::asio::post(socket_.get_executor(), [handler]() {
            handler(boost::system::error_code(), 0);
        });
        return;
    }
    doRead(n - in_.readableSize(), 0, std::move(handler));
}

void Framer::readSome(ReadHandler handler)
{
    doRead(1, 0, std::move(handler));
}

void Framer::doRead(std::size_t atLeast, std::size_t total, ReadHandler handler)
{
    if(in_.readableSize() >= maxReadBufferSize_) {
        SPDLOG_ERROR("Framer {}, read buffer reached {} bytes", (void *)this, in_.readableSize());
        boost::asio::post(socket_.get_executor(), [handler, total]() {
            handler(boost::asio::error::no_buffer_space, total);
        });
        return;
    }
    in_.reserve(readBufferSize_);
    std::size_t size = std::min<std::size_t>(in_.writableSize(), maxReadBufferSize_ - in_.readableSize());
    reading_ = true;
    socket_.async_read_some(boost::asio::buffer(in_.writeBuffer(), size),
    [this, atLeast, total, handler](const boost::system::error_code & ec, std::size_t n) {
        reading_ = false;
        if(ec) {
            handler(ec, total);
            return;
        }
        in_.commit(n);
        if(n >= atLeast) {
            handler(ec, total + n);
        } else {
            doRead(atLeast - n, total + n, handler);
        }
    });
}

std::string_view Framer::peek(std::size_t n) const
{
    return in_.peek(n);
}

void Framer::writeAll(std::string_view bytes)
{
    out_.append(bytes);
}

void Framer::flush(FlushHandler handler)
{
    flushHandlers_.push_back(std::move(handler));
    doWrite();
}

void Framer::doWrite()
{
    if(writing_) {
        return;
    }
    if(out_.readableSize() == 0) {
        std::vector<FlushHandler> handlers;
        handlers.swap(flushHandlers_);
        if(!handlers.empty()) {
            boost::asio::post(socket_.get_executor(), [handlers]() {
                for(auto &h : handlers) {
                    h(boost::system::error_code());
                }
            });
        }
        return;
    }
    out_.swap(outFlush_);
    out_.clear();
    writing_ = true;
    boost::asio::async_write(socket_, boost::asio::buffer(outFlush_.readBuffer(), outFlush_.readableSize()),
    [this](const boost::system::error_code & ec, std::size_t) {
        writing_ = false;
        outFlush_.clear();
        if(ec) {
            std::vector<FlushHandler> handlers;
            handlers.swap(flushHandlers_);
            for(auto &h : handlers) {
                h(ec);
            }
            return;
        }
        doWrite();
    });
}

std::string Framer::remote() const
{
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if(ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void Framer::close()
{
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if(ec) {
        SPDLOG_DEBUG("Framer {}, close: {}", (void *)this, ec.message());
    }
}
}
