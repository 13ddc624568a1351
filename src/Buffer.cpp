#include <algorithm>
#include <cassert>
#include <cstring>
#include <utility>
#include "Buffer.hpp"

namespace rtmpingest {

Buffer::Buffer() : start_(nullptr), capacity_(0), readPos_(0), writePos_(0)
{
}

Buffer::Buffer(uint32_t capacity)
    : start_(capacity > 0 ? new uint8_t[capacity] : nullptr),
      capacity_(capacity),
      readPos_(0),
      writePos_(0)
{
}

Buffer::Buffer(Buffer &&other) noexcept : Buffer()
{
    swap(other);
}

Buffer &Buffer::operator=(Buffer &&other) noexcept
{
    if(this != &other) {
        Buffer tmp(std::move(other));
        swap(tmp);
    }
    return *this;
}

Buffer::~Buffer()
{
    delete []start_;
}

void Buffer::clear()
{
    readPos_ = writePos_ = 0;
}

void Buffer::swap(Buffer &other) noexcept
{
    std::swap(start_, other.start_);
    std::swap(capacity_, other.capacity_);
    std::swap(readPos_, other.readPos_);
    std::swap(writePos_, other.writePos_);
}

const uint8_t *Buffer::readBuffer() const
{
    return start_ + readPos_;
}

uint32_t Buffer::readableSize() const
{
    return writePos_ - readPos_;
}

std::string_view Buffer::stringView() const
{
    if(readableSize() == 0) {
        return std::string_view();
    }
    return std::string_view((const char *)readBuffer(), readableSize());
}

std::string_view Buffer::peek(uint32_t n) const
{
    if(readableSize() < n || n == 0) {
        return std::string_view();
    }
    return std::string_view((const char *)readBuffer(), n);
}

void Buffer::erase(uint32_t n)
{
    assert((writePos_ - readPos_) >= n);
    readPos_ += n;
    if(readPos_ == writePos_) {
        readPos_ = writePos_ = 0;
    }
}

uint8_t *Buffer::writeBuffer()
{
    normalize();
    return (start_ + writePos_);
}

uint32_t Buffer::writableSize() const
{
    return capacity_ - writePos_;
}

uint32_t Buffer::capacity() const
{
    return capacity_;
}

void Buffer::commit(uint32_t n)
{
    assert((capacity_ - writePos_) >= n);
    writePos_ += n;
}

void Buffer::reserve(uint32_t n)
{
    if((capacity_ - (writePos_ - readPos_)) >= n) {
        normalize();
    } else {
        // grow geometrically so repeated small appends stay amortized
        uint32_t newCapacity = std::max<uint32_t>((writePos_ - readPos_) + n, capacity_ * 2);
        Buffer newBuffer(newCapacity);
        if(readableSize() > 0) {
            memcpy(newBuffer.start_, readBuffer(), readableSize());
            newBuffer.writePos_ = readableSize();
        }
        swap(newBuffer);
    }
}

void Buffer::append(const uint8_t *data, uint32_t n)
{
    if(n == 0) {
        return;
    }
    reserve(n);
    memcpy(writeBuffer(), data, n);
    commit(n);
}

void Buffer::append(std::string_view data)
{
    append((const uint8_t *)data.data(), data.size());
}

void Buffer::append(const Buffer &other)
{
    append(other.readBuffer(), other.readableSize());
}

void Buffer::normalize()
{
    if(readPos_ > 0) {
        if(writePos_ > readPos_) {
            memmove(start_, start_ + readPos_, writePos_ - readPos_);
            writePos_ -= readPos_;
            readPos_ = 0;
        } else {
            readPos_ = writePos_ = 0;
        }
    }
}
}
