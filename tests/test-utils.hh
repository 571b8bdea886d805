#pragma once

#include <pointer-core/assert-handler.hh>

#include <optional>
#include <string>
#include <vector>

namespace pc_test
{
struct assertion_failure
{
    std::string message;
};

/// Runs f with a throwing assertion handler installed
/// Returns the message of the first failed assertion, or nullopt if f completed
template <class F>
std::optional<std::string> assertion_message_of(F&& f)
{
    auto handler = pc::impl::scoped_assertion_handler([](pc::impl::assertion_info const& info)
                                                      { throw assertion_failure{info.message}; });
    try
    {
        f();
    }
    catch (assertion_failure const& failure)
    {
        return failure.message;
    }
    return std::nullopt;
}

template <class F>
bool triggers_assertion(F&& f)
{
    return assertion_message_of(static_cast<F&&>(f)).has_value();
}

// Instrumented non-trivial type that counts constructions and records destruction order
struct tracked
{
    int value = 0;

    static inline int ctor_count = 0;
    static inline int copy_count = 0;
    static inline int move_count = 0;
    static inline int dtor_count = 0;
    static inline std::vector<int> destroyed;

    // copy construction throws once this many copies have been made (negative: never)
    static inline int throw_after_copies = -1;

    static void reset()
    {
        ctor_count = 0;
        copy_count = 0;
        move_count = 0;
        dtor_count = 0;
        destroyed.clear();
        throw_after_copies = -1;
    }

    static int alive() { return ctor_count + copy_count + move_count - dtor_count; }

    tracked() { ++ctor_count; }
    explicit tracked(int v) : value(v) { ++ctor_count; }

    tracked(tracked const& rhs) : value(rhs.value)
    {
        if (throw_after_copies >= 0 && copy_count == throw_after_copies)
            throw copy_failure{};
        ++copy_count;
    }
    tracked(tracked&& rhs) noexcept : value(rhs.value)
    {
        rhs.value = -1;
        ++move_count;
    }

    tracked& operator=(tracked const& rhs) = default;
    tracked& operator=(tracked&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }

    ~tracked()
    {
        ++dtor_count;
        destroyed.push_back(value);
    }

    struct copy_failure
    {
    };
};
} // namespace pc_test

// CHECKs that evaluating expr violates a precondition (PC_ASSERT family or shadow memory-state check)
#define PC_CHECK_ASSERTS(expr) CHECK(::pc_test::triggers_assertion([&] { (void)(expr); }))
