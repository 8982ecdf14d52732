#pragma once

// Lean header with minimal dependencies, included by every container header.
#include <ordered-core/fwd.hh>
#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

// =========================================================================================================
// OC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Enabled in OC_DEBUG and OC_RELWITHDEBINFO builds.
//   In OC_RELEASE builds, disabled unless OC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   They catch PROGRAMMER ERRORS such as reading an element past the end of a collection.
//
// What assertions are NOT for:
//   - NOT for "nothing found" outcomes (those return oc::optional or -1)
//   - NOT for out-of-range bounds of region operations (slice, splice, fill, copy_within clamp)
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - optional<T>     -> expected "no value" results (pop on empty, find without match)
//   - Exceptions      -> only thrown by custom assertion handlers to unwind to a recovery point
//
// Usage:
//   OC_ASSERT(count >= 0, "count must be non-negative");
//   OC_ASSERT(!empty(), "front() on empty collection");
//
#define OC_ASSERT(cond, msg) OC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// OC_ASSERT_ALWAYS - Always-active assertion
//
// Like OC_ASSERT but remains active in all build configurations, including release builds.
//
#define OC_ASSERT_ALWAYS(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// OC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define OC_DEBUG_BREAK() OC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// OC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define OC_BREAK_AND_ABORT() (OC_DEBUG_BREAK(), ::oc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace oc::impl
{
// what kind of programmer error was detected
enum class assertion_kind
{
    // a plain OC_ASSERT / OC_ASSERT_ALWAYS condition failed
    generic,
    // checked element access (get / set / remove_at) with an index outside [0, length)
    index_out_of_range,
};

// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints to stderr)
// Note: does not abort, caller must follow with OC_BREAK_AND_ABORT()
OC_COLD_FUNC void handle_assert_failure(char const* expression,
                                        char const* message,
                                        oc::source_location location,
                                        assertion_kind kind = assertion_kind::generic);

// Reports an index-out-of-range access and terminates
// Custom handlers may throw to unwind instead
// The message has the form "index 7 is out of range for length 3"
[[noreturn]] OC_COLD_FUNC void report_index_out_of_range(isize index,
                                                         isize length,
                                                         oc::source_location location = oc::source_location::current());

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace oc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef OC_COMPILER_MSVC

#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(OC_COMPILER_POSIX)

// SIGTRAP is 5, see https://man7.org/linux/man-pages/man7/signal.7.html
// raise is declared here to avoid pulling <csignal> into every header
extern "C" int raise(int) noexcept;
#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define OC_IMPL_DEBUG_BREAK() void(0)

#endif

#define OC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::oc::impl::handle_assert_failure(#cond, msg, ::oc::source_location::current()); \
            OC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if OC_ASSERT_ENABLED

#define OC_IMPL_ASSERT(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the message must still compile
#define OC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OC_UNUSED(cond);          \
        OC_UNUSED(msg);           \
    } while (false)

#endif
