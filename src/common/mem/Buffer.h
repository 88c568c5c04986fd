#ifndef JSTREAM_MEM_BUFFER_H
#define JSTREAM_MEM_BUFFER_H

#include <cstddef>
#include <string_view>

namespace jstream::mem {

// Growable byte buffer with a consumable front. Bytes are appended at the tail
// (directly or through prepare()/commit()) and discarded from the head.
class Buffer {
public:
    Buffer();
    ~Buffer();
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;
    Buffer(Buffer &&) = delete;
    Buffer &operator=(Buffer &&) = delete;

    void clear();
    [[nodiscard]] bool append(const char *data, std::size_t len);
    [[nodiscard]] bool append(char ch);

    // Returns writable space for at least `len` bytes past the tail, or null
    // when allocation fails. commit() publishes what was written.
    [[nodiscard]] char *prepare(std::size_t len);
    void commit(std::size_t len);

    // Drops `len` bytes from the front.
    void consume(std::size_t len);

    [[nodiscard]] const char *data() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::string_view view() const;
    [[nodiscard]] std::size_t capacity() const;

private:
    [[nodiscard]] bool reserve(std::size_t desired);

    char *data_;
    std::size_t total_;
    std::size_t begin_;
    std::size_t end_;
};

} // namespace jstream::mem

#endif // JSTREAM_MEM_BUFFER_H
