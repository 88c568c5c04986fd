#ifndef JSTREAM_ASYNC_TASK_H
#define JSTREAM_ASYNC_TASK_H

#include <concepts>
#include <coroutine>
#include <expected>
#include <optional>
#include <utility>

#include "../common/StreamError.h"

namespace jstream::async {

class TaskPromiseBase {
public:
    std::suspend_always initial_suspend() noexcept {
        return {};
    }

    struct FinalAwaiter {
        bool await_ready() noexcept {
            return false;
        }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept {
            std::coroutine_handle<> cont = handle.promise().continuation();
            if (!cont) {
                return std::noop_coroutine();
            }
            return cont;
        }

        void await_resume() noexcept {
        }
    };

    FinalAwaiter final_suspend() noexcept {
        return {};
    }

    void set_continuation(std::coroutine_handle<> handle) {
        continuation_ = handle;
    }

    std::coroutine_handle<> continuation() const {
        return continuation_;
    }

private:
    std::coroutine_handle<> continuation_ = nullptr;
};

// Lazily started coroutine producing a StreamResult<T>. Awaiting it starts the
// body and resumes the awaiter when the body finishes; a top-level owner can
// drive it with start() instead.
template <typename T>
class Task {
public:
    struct promise_type : TaskPromiseBase {
        std::optional<common::StreamResult<T>> result_;

        Task get_return_object() {
            return Task{handle_type::from_promise(*this)};
        }

        void unhandled_exception() {
            result_ = std::unexpected(common::StreamError{common::StreamErr::Internal, "unhandled exception"});
        }

        template <typename U>
            requires std::convertible_to<U, T>
        void return_value(U &&value) {
            result_ = common::StreamResult<T>(std::in_place, std::forward<U>(value));
        }

        void return_value(common::StreamResult<T> value) {
            result_ = std::move(value);
        }

        common::StreamResult<T> result() {
            if (!result_) {
                return std::unexpected(common::StreamError{common::StreamErr::Internal, "no result"});
            }
            return std::move(*result_);
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    Task() = default;
    explicit Task(handle_type handle) : handle_(handle) {
    }

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    Task(Task &&other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)), started_(std::exchange(other.started_, false)) {
    }

    Task &operator=(Task &&other) noexcept {
        if (this == &other) {
            return *this;
        }
        if (handle_) {
            handle_.destroy();
        }
        handle_ = std::exchange(other.handle_, nullptr);
        started_ = std::exchange(other.started_, false);
        return *this;
    }

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    bool valid() const {
        return static_cast<bool>(handle_);
    }

    bool done() const {
        return handle_ && handle_.done();
    }

    // Runs the body until its first suspension. Only for tasks nobody awaits.
    void start() {
        if (handle_ && !started_) {
            started_ = true;
            handle_.resume();
        }
    }

    common::StreamResult<T> result() {
        if (!done()) {
            return std::unexpected(common::StreamError{common::StreamErr::Internal, "task not finished"});
        }
        return handle_.promise().result();
    }

    struct Awaiter {
        handle_type handle;

        bool await_ready() const noexcept {
            return !handle || handle.done();
        }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> cont) {
            handle.promise().set_continuation(cont);
            return handle;
        }

        common::StreamResult<T> await_resume() {
            if (!handle) {
                return std::unexpected(common::StreamError{common::StreamErr::Internal, "invalid task"});
            }
            return handle.promise().result();
        }
    };

    Awaiter operator co_await() {
        return Awaiter{handle_};
    }

private:
    handle_type handle_ = nullptr;
    bool started_ = false;
};

} // namespace jstream::async

#endif // JSTREAM_ASYNC_TASK_H
