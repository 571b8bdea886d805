#pragma once

#include <source_location>

namespace pc
{
/// Source location captured by the assertion macros (file, line, column, function)
/// Usage:
///   void check(pc::source_location loc = pc::source_location::current());
using source_location = std::source_location;
} // namespace pc
