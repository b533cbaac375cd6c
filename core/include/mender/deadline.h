#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace mender {

// Run fn on a detached worker and wait at most `budget` for its result.
// On expiry the worker is abandoned: its eventual result is dropped and it
// only touches the shared state below, so everything fn captures must be
// owned by fn itself (copies or shared_ptr).
// Exceptions thrown by fn before the deadline are rethrown to the caller.
// Throws std::system_error, without calling fn, when no worker thread can
// be started.
template <class T>
std::optional<T> run_with_deadline(std::function<T()> fn, std::chrono::milliseconds budget) {
    struct Shared {
        std::mutex mu;
        std::condition_variable cv;
        bool done{false};
        std::optional<T> value;
        std::exception_ptr error;
    };
    auto st = std::make_shared<Shared>();

    std::thread([st, fn]() mutable {
        std::optional<T> v;
        std::exception_ptr err;
        try {
            v.emplace(fn());
        } catch (...) {
            err = std::current_exception();
        }
        std::lock_guard<std::mutex> lk(st->mu);
        st->value = std::move(v);
        st->error = err;
        st->done = true;
        st->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lk(st->mu);
    if (!st->cv.wait_for(lk, budget, [&] { return st->done; })) return std::nullopt;
    if (st->error) std::rethrow_exception(st->error);
    return std::move(st->value);
}

} // namespace mender
