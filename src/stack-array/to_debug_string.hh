#pragma once

#include <stack-array/fwd.hh>
#include <stack-array/to_string.hh>

#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <tuple>
#include <utility>

namespace sa
{
struct debug_string_config
{
    // once the output reaches this length, the current range is closed with ", ..."
    isize max_length = 100;
};

/// Renders a value for diagnostics (test failures, violation reports, logging).
/// Not a stable format.
///
/// The first rule that applies wins:
///   - anything convertible to std::string_view -> "text"
///   - char                                     -> 'c', with \n, \t, \x01, ... escapes
///   - sa::to_string(v) or ADL to_string(v)     -> as is
///   - v.to_string()                            -> as is
///   - iterable (fixed_vector, span, ...)       -> [e0, e1, ...], [] when empty
///   - tuple-like                               -> (e0, e1, ...)
///   - anything else                            -> hex dump of the object bytes, 0x...
///
/// Usage:
///   sa::to_debug_string(sa::fixed_vector<int, 4>{0, 1}); // "[0, 1]"
///   sa::to_debug_string(v, {.max_length = 20});          // "[0, 1, 2, 3, 4, 5, 6, ...]"
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

namespace impl
{
// writes the elements of one range or tuple, separated by ", "
// stops (and writes ", ...") once the output is over budget
struct debug_list_writer
{
    std::string& out;
    debug_string_config const& cfg;
    bool first = true;
    bool truncated = false;

    template <class E>
    bool add(E const& e)
    {
        if (truncated)
            return false;
        if (isize(out.size()) >= cfg.max_length)
        {
            out += ", ...";
            truncated = true;
            return false;
        }
        if (!first)
            out += ", ";
        first = false;
        out += sa::to_debug_string(e, cfg);
        return true;
    }
};

inline void append_escaped_char(std::string& s, char c)
{
    switch (c)
    {
    case '\0': s += "\\0"; return;
    case '\n': s += "\\n"; return;
    case '\r': s += "\\r"; return;
    case '\t': s += "\\t"; return;
    case '\\': s += "\\\\"; return;
    case '\'': s += "\\'"; return;
    default: break;
    }

    auto const u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7F)
    {
        s += std::format("\\x{:02X}", u);
    }
    else
        s += c;
}

template <class T>
std::string hex_dump(T const& v)
{
    // bytes in memory order, "_" between alignment units
    auto s = std::string("0x");
    auto const bytes = reinterpret_cast<unsigned char const*>(&v);
    for (std::size_t i = 0; i < sizeof(T); ++i)
    {
        if (i != 0 && i % alignof(T) == 0)
            s += '_';
        s += std::format("{:02X}", bytes[i]);
    }
    return s;
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string(1, '"');
        s += std::string_view(v);
        s += '"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string(1, '\'');
        impl::append_escaped_char(s, v);
        s += '\'';
        return s;
    }
    else if constexpr (requires { to_string(v); })
    {
        return to_string(v);
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string(1, '[');
        auto w = impl::debug_list_writer{s, cfg};
        for (auto const& e : v)
            if (!w.add(e))
                break;
        s += ']';
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string(1, '(');
        auto w = impl::debug_list_writer{s, cfg};
        [&]<std::size_t... I>(std::index_sequence<I...>) { (void)(w.add(std::get<I>(v)) && ...); }(
            std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ')';
        return s;
    }
    else
    {
        return impl::hex_dump(v);
    }
}
} // namespace sa
