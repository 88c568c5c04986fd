#include "Buffer.h"

#include <cstdlib>
#include <cstring>

#include "../Assert.h"

namespace jstream::mem {

Buffer::Buffer()
    : data_(nullptr), total_(0), begin_(0), end_(0) {}

Buffer::~Buffer() {
    std::free(data_);
}

void Buffer::clear() {
    begin_ = 0;
    end_ = 0;
}

bool Buffer::append(const char *data, std::size_t len) {
    if (len == 0) {
        return true;
    }
    if (!data) {
        return false;
    }
    char *dst = prepare(len);
    if (!dst) {
        return false;
    }
    std::memcpy(dst, data, len);
    commit(len);
    return true;
}

bool Buffer::append(char ch) {
    return append(&ch, 1);
}

char *Buffer::prepare(std::size_t len) {
    if (!reserve(size() + len)) {
        return nullptr;
    }
    return data_ + end_;
}

void Buffer::commit(std::size_t len) {
    JSTREAM_ASSERT(end_ + len <= total_);
    end_ += len;
}

void Buffer::consume(std::size_t len) {
    JSTREAM_ASSERT(len <= size());
    begin_ += len;
    if (begin_ == end_) {
        begin_ = 0;
        end_ = 0;
    }
}

const char *Buffer::data() const {
    return data_ + begin_;
}

std::size_t Buffer::size() const {
    return end_ - begin_;
}

bool Buffer::empty() const {
    return begin_ == end_;
}

std::string_view Buffer::view() const {
    return std::string_view(data(), size());
}

std::size_t Buffer::capacity() const {
    return total_;
}

bool Buffer::reserve(std::size_t desired) {
    if (begin_ + desired <= total_) {
        return true;
    }
    // Reclaim the consumed prefix before growing.
    if (begin_ > 0) {
        std::size_t live = size();
        std::memmove(data_, data_ + begin_, live);
        begin_ = 0;
        end_ = live;
        if (desired <= total_) {
            return true;
        }
    }
    std::size_t new_total = (total_ == 0) ? 64 : total_;
    while (new_total < desired) {
        new_total *= 2;
    }
    auto *new_data = static_cast<char *>(std::realloc(data_, new_total));
    if (!new_data) {
        return false;
    }
    data_ = new_data;
    total_ = new_total;
    return true;
}

} // namespace jstream::mem
