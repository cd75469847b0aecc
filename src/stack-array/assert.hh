#pragma once

// This is a very lean header with minimal dependencies - easy to include everywhere and low cost.
#include <stack-array/fwd.hh>
#include <stack-array/macros.hh>

#include <source_location>

// =========================================================================================================
// Contract checks
//
// stack-array distinguishes three kinds of contract violations (sa::impl::violation_kind):
//
//   capacity_exceeded    -> an operation would need more than N live slots
//                           (push_back, insert_at, append, extend_from_span, oversized initializers)
//   index_out_of_bounds  -> an index or range does not fit the current size
//                           (operator[], insert_at, pop_at, pop_at_unordered, drain, subspan)
//   precondition         -> any other programmer error (pop_back on empty, negative truncate, ...)
//
// All of them are PROGRAMMER ERRORS. They are checked before the container is touched, so a
// refused operation never leaves a partial mutation behind.
//
// What happens on failure:
//   1. the topmost handler of the assertion handler stack is called (see assert-handler.hh),
//      or the default handler that prints the violation to stderr
//   2. if the handler returns, we break into an attached debugger and abort
//
// A handler may throw to unwind to a recovery point instead. This is how tests observe
// violations, and how production code can turn them into less serious failures.
//
// Which checks are active:
//   SA_CHECK_CAPACITY, SA_CHECK_BOUNDS, SA_ASSERT_ALWAYS -> always (they guard the inline buffer)
//   SA_ASSERT                                            -> when SA_ASSERT_ENABLED (not in SA_RELEASE,
//                                                           unless SA_ENABLE_ASSERT_IN_RELEASE)
//
// Error handling strategy:
//   - Contract checks -> programmer errors, violated invariants/preconditions
//   - Exceptions      -> thrown by user code (element constructors, predicates) and propagated
//                        unchanged after the container restored its invariants
//   - return values   -> expected conditions (try_push_back, try_pop_back, byte_writer::write_all)
//
// Usage:
//   SA_ASSERT(ptr != nullptr, "pointer must not be null");
//   SA_CHECK_CAPACITY(size() + 1, capacity(), "push_back on full fixed_vector");
//   SA_CHECK_BOUNDS(0 <= idx && idx < size(), idx, size(), "index out of bounds");
//
#define SA_ASSERT(cond, msg) SA_IMPL_ASSERT(cond, msg)

// Like SA_ASSERT but active in all build configurations.
#define SA_ASSERT_ALWAYS(cond, msg) SA_IMPL_ASSERT_ALWAYS(cond, msg)

// Reports capacity_exceeded when `required` live slots exceed `capacity`.
// Both arguments are evaluated exactly once.
#define SA_CHECK_CAPACITY(required, capacity, msg) SA_IMPL_CHECK_CAPACITY(required, capacity, msg)

// Reports index_out_of_bounds when `cond` is false.
// `value` and `bound` are only evaluated on failure and end up in the violation report.
#define SA_CHECK_BOUNDS(cond, value, bound, msg) SA_IMPL_CHECK_BOUNDS(cond, value, bound, msg)

// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline so the debugger stops at the violation site.
#define SA_DEBUG_BREAK() SA_IMPL_DEBUG_BREAK()

// Debug break (if attached) followed by unconditional termination.
#define SA_BREAK_AND_ABORT() (SA_DEBUG_BREAK(), ::sa::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sa
{
using source_location = std::source_location;
}

namespace sa::impl
{
enum class violation_kind
{
    precondition,
    capacity_exceeded,
    index_out_of_bounds,
};

// Called when a contract check fails
// Dispatches to the topmost assertion handler or prints to stderr
// `value` / `bound` are the offending quantity and its limit (0 / 0 for plain assertions)
// Note: does not abort, caller must follow with SA_BREAK_AND_ABORT()
SA_COLD_FUNC void handle_assert_failure(violation_kind kind,
                                        char const* expression,
                                        char const* message,
                                        isize value,
                                        isize bound,
                                        sa::source_location location);

// Checks if a debugger is currently attached to the process
// Platform-specific implementation (Windows: IsDebuggerPresent, Linux: /proc)
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace sa::impl

#ifdef SA_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define SA_IMPL_DEBUG_BREAK() (::sa::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SA_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define SA_IMPL_DEBUG_BREAK() (::sa::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SA_IMPL_DEBUG_BREAK() void(0)

#endif

#define SA_IMPL_REPORT(kind, expr_str, msg, value, bound)                                                     \
    do                                                                                                        \
    {                                                                                                         \
        ::sa::impl::handle_assert_failure(kind, expr_str, msg, value, bound, ::sa::source_location::current()); \
        SA_BREAK_AND_ABORT();                                                                                 \
    } while (false)

#define SA_IMPL_ASSERT_ALWAYS(cond, msg)                                                   \
    do                                                                                     \
    {                                                                                      \
        if (!(cond)) [[unlikely]]                                                          \
            SA_IMPL_REPORT(::sa::impl::violation_kind::precondition, #cond, msg, 0, 0); \
    } while (false)

#define SA_IMPL_CHECK_CAPACITY(required, capacity, msg)                                                 \
    do                                                                                                  \
    {                                                                                                   \
        ::sa::isize const _sa_required = (required);                                                    \
        ::sa::isize const _sa_capacity = (capacity);                                                    \
        if (_sa_required > _sa_capacity) [[unlikely]]                                                   \
            SA_IMPL_REPORT(::sa::impl::violation_kind::capacity_exceeded, #required " <= " #capacity, msg, \
                           _sa_required, _sa_capacity);                                                 \
    } while (false)

#define SA_IMPL_CHECK_BOUNDS(cond, value, bound, msg)                                                             \
    do                                                                                                            \
    {                                                                                                             \
        if (!(cond)) [[unlikely]]                                                                                 \
            SA_IMPL_REPORT(::sa::impl::violation_kind::index_out_of_bounds, #cond, msg, ::sa::isize(value),     \
                           ::sa::isize(bound));                                                                   \
    } while (false)

#if SA_ASSERT_ENABLED

#define SA_IMPL_ASSERT(cond, msg) SA_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// Stripped, but the condition and message still have to compile
#define SA_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SA_UNUSED(cond);          \
        SA_UNUSED(msg);           \
    } while (false)

#endif
