#include "byte_buffer.h"

#include <algorithm>
#include <cstring>

ByteBuffer::ByteBuffer(size_t initialCapacity)
    : storage_(std::max<size_t>(initialCapacity, 64)) {
}

void ByteBuffer::append(const char* data, size_t n) {
    if (n == 0) {
        return;
    }
    if (write_ + n > storage_.size()) {
        compact();
        if (write_ + n > storage_.size()) {
            storage_.resize(std::max(storage_.size() * 2, write_ + n));
        }
    }
    std::memcpy(storage_.data() + write_, data, n);
    write_ += n;
}

void ByteBuffer::consume(size_t n) {
    read_ += std::min(n, size());
    if (read_ == write_) {
        read_ = 0;
        write_ = 0;
    }
}

void ByteBuffer::compact() {
    if (read_ == 0) {
        return;
    }
    const size_t unread = size();
    if (unread > 0) {
        std::memmove(storage_.data(), storage_.data() + read_, unread);
    }
    read_ = 0;
    write_ = unread;
}

void ByteBuffer::clear() {
    read_ = 0;
    write_ = 0;
}

size_t ByteBuffer::find(const char* pattern, size_t patternLength, size_t from) const {
    if (patternLength == 0 || size() < patternLength || from > size() - patternLength) {
        return npos;
    }
    const char* begin = data();
    const char* end = begin + size();
    const char* hit = std::search(begin + from, end, pattern, pattern + patternLength);
    return hit == end ? npos : static_cast<size_t>(hit - begin);
}

std::string ByteBuffer::toString(size_t n) const {
    return std::string(data(), std::min(n, size()));
}
