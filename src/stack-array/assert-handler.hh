#pragma once

#include <stack-array/assert.hh>

#include <functional>
#include <string>

// Violation reporting hooks.
//
// Every failed SA_ASSERT / SA_ASSERT_ALWAYS / SA_CHECK_CAPACITY / SA_CHECK_BOUNDS builds an
// assertion_info and passes it to the innermost installed handler (or prints it to stderr when
// none is installed). If the handler returns, the process aborts. A handler that throws unwinds
// out of the failed operation instead, and since every check runs before the container is
// modified, the container is left as it was.
//
// The handler stack is process-global and not synchronized.
//
// Example, turning capacity violations into an exception at a system boundary:
//   auto guard = sa::impl::scoped_assertion_handler([](sa::impl::assertion_info const& info) {
//       if (info.kind == sa::impl::violation_kind::capacity_exceeded)
//           throw packet_too_large{info.value, info.bound};
//   });
//   decode_into(buffer, bytes);

namespace sa::impl
{
struct assertion_info
{
    violation_kind kind = violation_kind::precondition;

    // stringified condition and the message given at the check site
    std::string expression;
    std::string message;

    // capacity_exceeded: required slots and capacity
    // index_out_of_bounds: offending index (or range end) and the bound it violated
    // precondition: both 0
    isize value = 0;
    isize bound = 0;

    sa::source_location location;
};

[[nodiscard]] char const* to_string(violation_kind kind);

// multi-line report used by the default handler, which follows it with a stacktrace
[[nodiscard]] std::string format_violation(assertion_info const& info);

void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
void pop_assertion_handler();

// pushes in the constructor, pops in the destructor (also during unwinding)
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace sa::impl
