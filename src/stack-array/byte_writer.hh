#pragma once

#include <stack-array/fixed_vector.hh>

#include <type_traits>

namespace sa
{
enum class write_status
{
    ok,
    capacity_exceeded,
};
}

/// Sink that appends bytes to a fixed_vector of a 1-byte element type (u8, char, std::byte, ...).
/// The writer does not own the vector; the vector must outlive it.
///
/// write() is a short write: it appends as much as fits and returns how much that was.
/// write_all() is all or nothing and reports write_status::capacity_exceeded without touching the
/// vector when the bytes do not fit. Neither of them is a contract violation.
///
/// Usage:
///   sa::fixed_vector<u8, 64> buf;
///   auto w = sa::byte_writer(buf);
///   if (w.write_all(header) != sa::write_status::ok)
///       return false;
template <class T, sa::isize N>
struct sa::byte_writer
{
    static_assert(sizeof(T) == 1, "byte_writer requires a 1-byte element type");
    static_assert(std::is_trivially_copyable_v<T>, "byte_writer requires a trivially copyable element type");

    explicit byte_writer(fixed_vector<T, N>& target) : _target(&target) {}

    /// Appends as many bytes as fit, returns that count (0 when the vector is full).
    isize write(span<T const> bytes)
    {
        auto const count = sa::min(bytes.size(), _target->remaining_capacity());
        _target->extend_from_span(bytes.first(count));
        return count;
    }

    /// Appends all bytes or nothing.
    [[nodiscard]] write_status write_all(span<T const> bytes)
    {
        if (bytes.size() > _target->remaining_capacity())
            return write_status::capacity_exceeded;
        _target->extend_from_span(bytes);
        return write_status::ok;
    }

    /// Nothing is buffered, always ok.
    write_status flush() { return write_status::ok; }

    [[nodiscard]] fixed_vector<T, N>& target() const { return *_target; }

private:
    fixed_vector<T, N>* _target;
};
