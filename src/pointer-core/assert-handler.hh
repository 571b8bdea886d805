#pragma once

#include <pointer-core/source_location.hh>

#include <functional>
#include <string>

// Failed checks go to the innermost installed handler, or are printed to stderr when there is none.
// If the handler returns, the failure still ends in a debug break and abort.
// If it throws, the exception unwinds to the caller, which is how tests observe violations:
//
//   auto handler = pc::impl::scoped_assertion_handler(
//       [](pc::impl::assertion_info const& info) { throw violation{info.message}; });
//   (void)buffer[buffer.count()]; // throws violation
//
// Every check runs before the state it guards is touched, so a handle or the shadow registry is
// unchanged after such an unwind.
//
// The handler stack is process-global and unsynchronized. Install handlers from a single thread.

namespace pc::impl
{
struct assertion_info
{
    std::string expression; // the failed condition, as written
    std::string message;
    pc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// installs a handler for the lifetime of this object
/// scopes must nest, the innermost is removed first (also when unwinding)
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace pc::impl
