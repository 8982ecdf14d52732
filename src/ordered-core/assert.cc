#include "assert.hh"

#include <ordered-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#ifdef OC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef OC_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, must be externally synchronized
std::vector<std::move_only_function<void(oc::impl::assertion_info const&)>> g_assertion_handlers;

char const* kind_name(oc::impl::assertion_kind kind)
{
    switch (kind)
    {
    case oc::impl::assertion_kind::generic:
        return "assertion failed";
    case oc::impl::assertion_kind::index_out_of_range:
        return "index out of range";
    }
    return "assertion failed";
}

void default_assert_handler(oc::impl::assertion_info const& info)
{
    std::cerr << "[ordered-core] " << kind_name(info.kind) << ": " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
}
} // namespace

void oc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void oc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

oc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

oc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

OC_COLD_FUNC void oc::impl::handle_assert_failure(char const* expression,
                                                  char const* message,
                                                  oc::source_location location,
                                                  assertion_kind kind)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
        .kind = kind,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

OC_COLD_FUNC void oc::impl::report_index_out_of_range(isize index, isize length, oc::source_location location)
{
    auto const message
        = "index " + std::to_string(index) + " is out of range for length " + std::to_string(length);

    handle_assert_failure("0 <= index && index < length", message.c_str(), location, assertion_kind::index_out_of_range);
    OC_BREAK_AND_ABORT();
}

bool oc::impl::is_debugger_connected() noexcept
{
#ifdef OC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(OC_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void oc::impl::perform_abort() noexcept
{
    std::abort();
}
