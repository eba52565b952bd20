#pragma once

#include <mirror-core/macros.hh>
#include <mirror-core/source_location.hh>

#include <functional>
#include <string>

namespace mc::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = mc::impl::scoped_assertion_handler([](mc::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw precondition_violation{info.message};
//       });
//
//       // Any assertion in this scope (e.g. deque.remove_at(-1)) uses the custom handler
//       risky_operation();
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    mc::source_location location;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
// All precondition checks in mirror-core run before any state is modified,
// so unwinding out of them leaves the container unchanged
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler, it pops even if the handler throws
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace mc::impl
