#ifndef JSTREAM_IO_PIPE_H
#define JSTREAM_IO_PIPE_H

#include <coroutine>
#include <cstddef>
#include <deque>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "../common/IoError.h"
#include "../common/StreamError.h"
#include "ChunkSource.h"

namespace jstream::io {

// In-memory byte pipe. The writer side appends segments and completes or
// fails the pipe; the reader side is a ChunkSource. A suspended read is
// resumed inline by the writer call that makes it ready, so both sides must
// run on the same thread.
class Pipe final : public ChunkSource {
public:
    Pipe() = default;
    ~Pipe() override = default;
    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;
    Pipe(Pipe &&) = delete;
    Pipe &operator=(Pipe &&) = delete;

    void write(std::string_view data);
    void complete();
    void fail(common::IoErr io, std::string message);

    // Completes the pending (or next) read with is_canceled set.
    void cancel_pending_read();

    async::Task<ReadResult> read(std::stop_token stop_token) override;
    void advance_to(std::size_t consumed, std::size_t examined) override;

    [[nodiscard]] std::size_t buffered() const noexcept {
        return buffered_;
    }

    [[nodiscard]] bool completed() const noexcept {
        return completed_;
    }

    [[nodiscard]] bool has_waiter() const noexcept {
        return static_cast<bool>(waiter_);
    }

private:
    struct StopWaiter {
        Pipe *pipe;

        void operator()() const noexcept;
    };

    // Deregisters itself when the reading frame is destroyed while suspended.
    class ReadAwaiter {
    public:
        ReadAwaiter(Pipe *pipe, std::stop_token stop_token) noexcept;
        ~ReadAwaiter();
        ReadAwaiter(const ReadAwaiter &) = delete;
        ReadAwaiter &operator=(const ReadAwaiter &) = delete;

        bool await_ready() const noexcept;
        bool await_suspend(std::coroutine_handle<> handle);
        void await_resume() noexcept {
            handle_ = nullptr;
        }

    private:
        Pipe *pipe_;
        std::stop_token stop_token_;
        std::coroutine_handle<> handle_ = nullptr;
    };

    [[nodiscard]] bool read_ready(const std::stop_token &stop_token) const noexcept;
    void wake_reader();
    ReadResult snapshot(bool canceled);

    std::deque<std::string> segments_;
    // Bytes of segments_.front() already consumed.
    std::size_t head_ = 0;
    std::size_t buffered_ = 0;
    std::size_t examined_ = 0;
    std::size_t last_read_size_ = 0;
    bool completed_ = false;
    bool cancel_pending_ = false;
    bool arming_ = false;
    std::optional<common::StreamError> fault_;
    std::coroutine_handle<> waiter_ = nullptr;
    std::optional<std::stop_callback<StopWaiter>> stop_callback_;
};

} // namespace jstream::io

#endif // JSTREAM_IO_PIPE_H
