#ifndef JSTREAM_ASYNC_ASYNC_GENERATOR_H
#define JSTREAM_ASYNC_ASYNC_GENERATOR_H

#include <coroutine>
#include <expected>
#include <optional>
#include <utility>

#include "../common/StreamError.h"

namespace jstream::async {

// Lazy, forward-only, single-pass sequence produced by a coroutine that may
// both co_await and co_yield. The body finishes with `co_return {};` or with
// `co_return std::unexpected(error);`.
//
//     while (true) {
//         auto item = co_await gen.next();
//         if (!item) { /* failed: item.error() */ }
//         if (!*item) { /* exhausted */ }
//         use(std::move(**item));
//     }
template <typename T>
class AsyncGenerator {
public:
    struct promise_type {
        std::optional<T> current_;
        std::optional<common::StreamError> error_;
        std::coroutine_handle<> consumer_ = nullptr;

        AsyncGenerator get_return_object() {
            return AsyncGenerator{handle_type::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept {
            return {};
        }

        struct TransferToConsumer {
            bool await_ready() noexcept {
                return false;
            }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> handle) noexcept {
                std::coroutine_handle<> consumer = std::exchange(handle.promise().consumer_, nullptr);
                if (!consumer) {
                    return std::noop_coroutine();
                }
                return consumer;
            }

            void await_resume() noexcept {
            }
        };

        TransferToConsumer final_suspend() noexcept {
            return {};
        }

        TransferToConsumer yield_value(T value) {
            current_.emplace(std::move(value));
            return {};
        }

        void return_value(common::StreamResult<void> result) {
            if (!result) {
                error_ = std::move(result.error());
            }
        }

        void unhandled_exception() {
            error_ = common::StreamError{common::StreamErr::Internal, "unhandled exception"};
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    AsyncGenerator() = default;
    explicit AsyncGenerator(handle_type handle) : handle_(handle) {
    }

    AsyncGenerator(const AsyncGenerator &) = delete;
    AsyncGenerator &operator=(const AsyncGenerator &) = delete;

    AsyncGenerator(AsyncGenerator &&other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {
    }

    AsyncGenerator &operator=(AsyncGenerator &&other) noexcept {
        if (this == &other) {
            return *this;
        }
        if (handle_) {
            handle_.destroy();
        }
        handle_ = std::exchange(other.handle_, nullptr);
        return *this;
    }

    // Destroying an unfinished generator destroys its frame, running the
    // destructors of the body's locals.
    ~AsyncGenerator() {
        if (handle_) {
            handle_.destroy();
        }
    }

    bool valid() const {
        return static_cast<bool>(handle_);
    }

    bool finished() const {
        return !handle_ || handle_.done();
    }

    struct NextAwaiter {
        handle_type handle;

        bool await_ready() const noexcept {
            return !handle || handle.done();
        }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> consumer) noexcept {
            handle.promise().current_.reset();
            handle.promise().consumer_ = consumer;
            return handle;
        }

        common::StreamResult<std::optional<T>> await_resume() {
            if (!handle) {
                return std::optional<T>{};
            }
            promise_type &promise = handle.promise();
            if (promise.current_) {
                std::optional<T> out(std::move(*promise.current_));
                promise.current_.reset();
                return out;
            }
            if (promise.error_) {
                return std::unexpected(*promise.error_);
            }
            return std::optional<T>{};
        }
    };

    // Resumes the body until it yields the next element or finishes.
    NextAwaiter next() {
        return NextAwaiter{handle_};
    }

private:
    handle_type handle_ = nullptr;
};

} // namespace jstream::async

#endif // JSTREAM_ASYNC_ASYNC_GENERATOR_H
