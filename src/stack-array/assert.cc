#include "assert.hh"

#include <stack-array/assert-handler.hh>
#include <stack-array/stacktrace.hh>
#include <stack-array/to_string.hh>
#include <stack-array/utility.hh>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#ifdef SA_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef SA_OS_LINUX
#include <fstream>
#endif

namespace
{
using handler_fn = std::move_only_function<void(sa::impl::assertion_info const&)>;

// NOTE: not thread-safe, see assert-handler.hh
std::vector<handler_fn>& handler_stack()
{
    static std::vector<handler_fn> handlers;
    return handlers;
}

void print_to_stderr(sa::impl::assertion_info const& info)
{
    auto report = sa::impl::format_violation(info);
    report += "\nstacktrace:\n";
    report += std::to_string(sa::stacktrace::current());
    report += '\n';
    std::fputs(report.c_str(), stderr);
    std::fflush(stderr);
}
} // namespace

// e.g.
//   capacity exceeded: push_back on a full container
//     check:    old_size + 1 <= N
//     required: 5 (capacity 4)
//     at:       fixed_vector-test.cc:42 in void test_fn()
std::string sa::impl::format_violation(assertion_info const& info)
{
    auto s = std::string(sa::impl::to_string(info.kind));
    s += ": ";
    s += info.message;
    s += "\n  check:    ";
    s += info.expression;

    switch (info.kind)
    {
    case sa::impl::violation_kind::capacity_exceeded:
        s += "\n  required: " + sa::to_string(info.value) + " (capacity " + sa::to_string(info.bound) + ")";
        break;
    case sa::impl::violation_kind::index_out_of_bounds:
        s += "\n  index:    " + sa::to_string(info.value) + " (bound " + sa::to_string(info.bound) + ")";
        break;
    case sa::impl::violation_kind::precondition:
        break;
    }

    s += "\n  at:       ";
    s += info.location.file_name();
    s += ':' + sa::to_string(info.location.line());
    s += " in ";
    s += info.location.function_name();
    s += '\n';
    return s;
}

char const* sa::impl::to_string(violation_kind kind)
{
    switch (kind)
    {
    case violation_kind::precondition:
        return "precondition violated";
    case violation_kind::capacity_exceeded:
        return "capacity exceeded";
    case violation_kind::index_out_of_bounds:
        return "index out of bounds";
    }
    return "unknown violation";
}

void sa::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    handler_stack().push_back(sa::move(handler));
}

void sa::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    SA_ASSERT(!handlers.empty(), "unbalanced pop_assertion_handler");
    if (!handlers.empty())
        handlers.pop_back();
}

sa::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    sa::impl::push_assertion_handler(sa::move(handler));
}

sa::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    sa::impl::pop_assertion_handler();
}

SA_COLD_FUNC void sa::impl::handle_assert_failure(violation_kind kind,
                                                  char const* expression,
                                                  char const* message,
                                                  isize value,
                                                  isize bound,
                                                  sa::source_location location)
{
    auto info = assertion_info{};
    info.kind = kind;
    info.expression = expression;
    info.message = message;
    info.value = value;
    info.bound = bound;
    info.location = location;

    auto& handlers = handler_stack();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info); // may throw, the caller only aborts if it returns
}

bool sa::impl::is_debugger_connected() noexcept
{
#ifdef SA_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(SA_OS_LINUX)
    // a traced process has a non-zero "TracerPid:" line in /proc/self/status
    std::ifstream status("/proc/self/status");
    std::string key;
    while (status >> key)
    {
        if (key == "TracerPid:")
        {
            long tracer = 0;
            status >> tracer;
            return tracer != 0;
        }
        status.ignore(4096, '\n');
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void sa::impl::perform_abort() noexcept
{
    std::abort();
}
