//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Minimal coroutine Task type bridging to std::future, plus an awaiter for co_await on futures
//==========================================================================================================

#pragma once

#include <chrono>
#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace mcpleague {
namespace async {

// Task<T> - coroutine-returning type that exposes a std::future<T>
// Usage: Task<T> foo() { co_return value; } -> foo().toFuture()

template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type {
        std::promise<T> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

// void specialization

template <>
class Task<void> {
public:
    struct promise_type {
        std::promise<void> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        void return_void() { promise.set_value(); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

//==========================================================================================================
// FutureAwaitable
// Purpose: Awaiter for std::future<T>. Waiting is offloaded to a detached thread which resumes the
//          coroutine once the future is ready; any stored exception is rethrown from await_resume.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace mcpleague
