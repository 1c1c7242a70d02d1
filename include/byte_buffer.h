#ifndef BYTE_BUFFER_H
#define BYTE_BUFFER_H

#include <cstddef>
#include <string>
#include <vector>

/**
 * Growable arena for socket input. Bytes are appended at the write end and
 * consumed from the read end; the storage is reused instead of reallocated
 * per chunk, and unread bytes are moved to the front by compact().
 */
class ByteBuffer {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    explicit ByteBuffer(size_t initialCapacity = 16 * 1024);

    void append(const char* data, size_t n);
    void consume(size_t n);
    void compact();
    void clear();

    const char* data() const { return storage_.data() + read_; }
    size_t size() const { return write_ - read_; }
    bool empty() const { return write_ == read_; }
    size_t capacity() const { return storage_.size(); }

    // Offset of `pattern` in the unread bytes, or npos
    size_t find(const char* pattern, size_t patternLength, size_t from = 0) const;

    std::string toString(size_t n) const;

private:
    std::vector<char> storage_;
    size_t read_ = 0;
    size_t write_ = 0;
};

#endif // BYTE_BUFFER_H
