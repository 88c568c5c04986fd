#include "Pipe.h"

#include <utility>

#include "../common/Assert.h"
#include "../common/Log.h"

namespace jstream::io {

void Pipe::StopWaiter::operator()() const noexcept {
    // Fired while the read is still arming: await_suspend sees the stop
    // request itself and does not suspend.
    if (pipe->arming_) {
        return;
    }
    pipe->wake_reader();
}

Pipe::ReadAwaiter::ReadAwaiter(Pipe *pipe, std::stop_token stop_token) noexcept
    : pipe_(pipe), stop_token_(std::move(stop_token)) {
}

Pipe::ReadAwaiter::~ReadAwaiter() {
    if (handle_ && pipe_->waiter_ == handle_) {
        pipe_->waiter_ = nullptr;
        pipe_->stop_callback_.reset();
    }
}

bool Pipe::ReadAwaiter::await_ready() const noexcept {
    return pipe_->read_ready(stop_token_);
}

bool Pipe::ReadAwaiter::await_suspend(std::coroutine_handle<> handle) {
    JSTREAM_ASSERT_MSG(!pipe_->waiter_, "concurrent reads on a pipe");
    pipe_->waiter_ = handle;
    pipe_->arming_ = true;
    if (stop_token_.stop_possible()) {
        pipe_->stop_callback_.emplace(stop_token_, StopWaiter{pipe_});
    }
    pipe_->arming_ = false;
    if (stop_token_.stop_requested()) {
        pipe_->waiter_ = nullptr;
        return false;
    }
    handle_ = handle;
    return true;
}

void Pipe::write(std::string_view data) {
    JSTREAM_ASSERT_MSG(!completed_, "write after pipe completion");
    if (data.empty()) {
        return;
    }
    segments_.emplace_back(data);
    buffered_ += data.size();
    wake_reader();
}

void Pipe::complete() {
    completed_ = true;
    wake_reader();
}

void Pipe::fail(common::IoErr io, std::string message) {
    log::debug("pipe failed by writer: {} ({})", message, common::io_err_name(io));
    fault_ = common::source_fault(io, std::move(message));
    completed_ = true;
    wake_reader();
}

void Pipe::cancel_pending_read() {
    cancel_pending_ = true;
    wake_reader();
}

async::Task<ReadResult> Pipe::read(std::stop_token stop_token) {
    co_await ReadAwaiter(this, stop_token);
    stop_callback_.reset();
    if (fault_) {
        co_return std::unexpected(*fault_);
    }
    bool canceled = stop_token.stop_requested();
    if (std::exchange(cancel_pending_, false)) {
        canceled = true;
    }
    co_return snapshot(canceled);
}

void Pipe::advance_to(std::size_t consumed, std::size_t examined) {
    JSTREAM_ASSERT(consumed <= examined);
    JSTREAM_ASSERT(examined <= last_read_size_);
    std::size_t remaining = consumed;
    while (remaining > 0) {
        std::size_t available = segments_.front().size() - head_;
        if (remaining < available) {
            head_ += remaining;
            break;
        }
        remaining -= available;
        segments_.pop_front();
        head_ = 0;
    }
    buffered_ -= consumed;
    examined_ = examined - consumed;
    last_read_size_ = 0;
}

bool Pipe::read_ready(const std::stop_token &stop_token) const noexcept {
    return fault_.has_value() || completed_ || cancel_pending_ || buffered_ > examined_ ||
           stop_token.stop_requested();
}

void Pipe::wake_reader() {
    std::coroutine_handle<> waiter = std::exchange(waiter_, nullptr);
    if (waiter) {
        waiter.resume();
    }
}

ReadResult Pipe::snapshot(bool canceled) {
    ReadResult result;
    std::size_t skip = head_;
    for (const std::string &segment : segments_) {
        result.buffer.append(std::string_view(segment).substr(skip));
        skip = 0;
    }
    result.is_completed = completed_;
    result.is_canceled = canceled;
    last_read_size_ = buffered_;
    return result;
}

} // namespace jstream::io
