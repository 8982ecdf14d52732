#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

#include <functional>
#include <string>

namespace oc::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = oc::impl::scoped_assertion_handler([](oc::impl::assertion_info const& info) {
//           if (info.kind == oc::impl::assertion_kind::index_out_of_range)
//               throw bad_index{info.message};
//       });
//
//       items.get(17); // reported through the handler above
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    oc::source_location location;
    assertion_kind kind = assertion_kind::generic;
};

// Push a custom assertion handler onto the handler stack
// Handlers may throw to unwind to a recovery point; if they return, the program aborts
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// Prefer scoped_assertion_handler, which also pops when a handler throws
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
} // namespace oc::impl
