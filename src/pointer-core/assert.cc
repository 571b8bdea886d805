#include "assert.hh"

#include <pointer-core/assert-handler.hh>
#include <pointer-core/asserts.hh>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

#ifdef PC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// innermost handler last
std::vector<pc::impl::assertion_handler>& handler_stack()
{
    static std::vector<pc::impl::assertion_handler> handlers;
    return handlers;
}

void print_violation(pc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "pointer-core: precondition violated: " << info.expression << '\n'
              << "  " << info.message << '\n'
              << "  at " << loc.file_name() << ':' << loc.line() << ':' << loc.column() << " in "
              << loc.function_name() << std::endl;
}

void dispatch(pc::impl::assertion_info const& info)
{
    auto& handlers = handler_stack();
    if (handlers.empty())
        print_violation(info);
    else
        handlers.back()(info);
}
} // namespace

pc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

pc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    handler_stack().pop_back();
}

void pc::impl::report_violation(char const* expression, char const* message, pc::source_location location)
{
    dispatch({expression, message, location});
}

void pc::impl::report_violation_sv(char const* expression, std::string_view message, pc::source_location location)
{
    dispatch({expression, std::string(message), location});
}

bool pc::impl::is_debugger_connected() noexcept
{
#ifdef PC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(PC_OS_LINUX)
    // a ptrace-attached debugger shows up as a non-zero TracerPid
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
        if (line.starts_with("TracerPid:"))
            return std::atoi(line.c_str() + 10) != 0;
    return false;
#else
    return false;
#endif
}

void pc::impl::perform_abort() noexcept
{
    std::abort();
}
