#pragma once

#include <stacktrace>

namespace sa
{
/// Call stack snapshot, std::stacktrace under our namespace.
/// The default violation report appends one after the location.
/// Usage:
///   auto trace = sa::stacktrace::current();
///   std::fputs(std::to_string(trace).c_str(), stderr);
using stacktrace = std::stacktrace;

using stacktrace_entry = std::stacktrace_entry;
} // namespace sa
