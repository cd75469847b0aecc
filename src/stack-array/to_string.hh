#pragma once

#include <stack-array/fwd.hh>

#include <string>
#include <string_view>

// Plain value-to-text conversions, used by to_debug_string for element rendering
// Locale independent (std::format with default specs)

namespace sa
{
// in hex, 0x prefixed
[[nodiscard]] std::string to_string(void const* ptr);

// true/false
[[nodiscard]] std::string to_string(bool b);

// 0xFF
[[nodiscard]] std::string to_string(byte b);

// simply the char (NOT quoted)
[[nodiscard]] std::string to_string(char c);

// integer types
// note: does not use the sized versions because this style is _complete_ for users
[[nodiscard]] std::string to_string(signed char i);
[[nodiscard]] std::string to_string(unsigned char i);
[[nodiscard]] std::string to_string(signed short i);
[[nodiscard]] std::string to_string(unsigned short i);
[[nodiscard]] std::string to_string(signed int i);
[[nodiscard]] std::string to_string(unsigned int i);
[[nodiscard]] std::string to_string(signed long i);
[[nodiscard]] std::string to_string(unsigned long i);
[[nodiscard]] std::string to_string(signed long long i);
[[nodiscard]] std::string to_string(unsigned long long i);

// shortest representation that round-trips
[[nodiscard]] std::string to_string(float f);
[[nodiscard]] std::string to_string(double f);

// no-op
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string_view s);
} // namespace sa
