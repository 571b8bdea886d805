#pragma once

#include <pointer-core/macros.hh>
#include <pointer-core/source_location.hh>

// Precondition checks
//
// Misusing a handle is undefined behavior: indexing past a buffer, loading from a misaligned address,
// reading cells that hold no object, rebinding live memory, releasing a block twice.
// pointer-core never turns these into recoverable errors. It checks what it can afford to check instead:
//
//   PC_ASSERT(cond, "literal")         compiled out unless PC_ASSERT_ENABLED
//   PC_ASSERT_ALWAYS(cond, "literal")  kept in every build, e.g. for allocation failure
//   PC_ASSERTS, PC_ASSERTS_ALWAYS      the same with a message built at runtime, see asserts.hh
//
// A failed check is reported to the innermost handler (assert-handler.hh), then breaks into an
// attached debugger and aborts. The message is only evaluated once the condition has failed.
//
// The only failure a caller is expected to handle is a null address passed to a handle factory,
// which comes back as an empty pc::optional. Exceptions only ever come from user code and pass through.

#define PC_ASSERT(cond, msg) PC_IMPL_ASSERT(cond, msg)
#define PC_ASSERT_ALWAYS(cond, msg) PC_IMPL_CHECK(::pc::impl::report_violation, cond, msg)

// stops in the debugger when one is attached, no-op otherwise
#define PC_DEBUG_BREAK() PC_IMPL_DEBUG_BREAK()

namespace pc::impl
{
// hands the failure to the innermost assertion handler
// returns if that handler returns, the abort happens at the call site
PC_COLD_FUNC void report_violation(char const* expression, char const* message, pc::source_location location);

[[nodiscard]] bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace pc::impl

#ifdef PC_COMPILER_MSVC
#define PC_IMPL_DEBUG_BREAK() (::pc::impl::is_debugger_connected() ? __debugbreak() : void(0))
#elif defined(PC_COMPILER_POSIX)
// SIGTRAP is 5, declared by hand so that <csignal> stays out of the handle headers
extern "C" int raise(int) noexcept;
#define PC_IMPL_DEBUG_BREAK() (::pc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#else
#define PC_IMPL_DEBUG_BREAK() void(0)
#endif

// report is one of the report_violation overloads: (char const* expression, message, source_location)
#define PC_IMPL_CHECK(report, cond, msg)                           \
    do                                                             \
    {                                                              \
        if (!(cond)) [[unlikely]]                                  \
        {                                                          \
            report(#cond, msg, ::pc::source_location::current()); \
            PC_IMPL_DEBUG_BREAK();                                 \
            ::pc::impl::perform_abort();                           \
        }                                                          \
    } while (false)

#if PC_ASSERT_ENABLED
#define PC_IMPL_ASSERT(cond, msg) PC_ASSERT_ALWAYS(cond, msg)
#else
#define PC_IMPL_ASSERT(cond, msg) (PC_UNUSED(cond), PC_UNUSED(msg))
#endif
