#pragma once

#include <pointer-core/assert.hh>

#include <string_view>

// Precondition checks whose message is assembled at runtime, typically to name the types involved:
//
//   PC_ASSERTS_ALWAYS(cell.type == type, "load: memory is bound to " + cell.type.name());
//
// Anything convertible to std::string_view is accepted. Same activation rules as PC_ASSERT.

#define PC_ASSERTS(cond, msg) PC_IMPL_ASSERTS(cond, msg)
#define PC_ASSERTS_ALWAYS(cond, msg) PC_IMPL_CHECK(::pc::impl::report_violation_sv, cond, msg)

namespace pc::impl
{
PC_COLD_FUNC void report_violation_sv(char const* expression, std::string_view message, pc::source_location location);
}

#if PC_ASSERT_ENABLED
#define PC_IMPL_ASSERTS(cond, msg) PC_ASSERTS_ALWAYS(cond, msg)
#else
#define PC_IMPL_ASSERTS(cond, msg) (PC_UNUSED(cond), PC_UNUSED(msg))
#endif
