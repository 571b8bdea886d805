#pragma once

#include <pointer-core/fwd.hh>
#include <pointer-core/utility.hh>

#include <functional>
#include <mutex>

/// Data T that can only be reached while holding its mutex
/// The lock is scoped to a callback, so references to the protected value cannot outlive the lock.
/// Used for process-global debug state such as the shadow memory-state registry.
template <class T>
struct pc::mutex
{
    /// Acquire the lock, invoke f with the protected value, and return its result
    /// Returns by value (auto) so references into the protected state do not leak
    /// Usage:
    ///   pc::mutex<int> counter;
    ///   counter.lock([](int& val) { val++; });
    ///   int current = counter.lock([](int const& val) { return val; });
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard guard(_mutex);
        return std::invoke(pc::forward<F>(f), _value);
    }

    mutex() = default;

    template <class... Args>
    explicit mutex(Args&&... args) : _value(pc::forward<Args>(args)...)
    {
    }

    mutex(mutex const&) = delete;
    mutex& operator=(mutex const&) = delete;

private:
    T _value;
    std::mutex _mutex;
};
