#pragma once

#include <cstddef>
#include <cstdint>

namespace sa
{
// fixed-width aliases used across the API
using i64 = std::int64_t;
using u8 = std::uint8_t;
using byte = std::byte;

// Sizes, indices, capacities and counts are all isize.
// Signed on purpose: "size - 1" on an empty container is -1 instead of a huge number,
// and a single "0 <= i && i < size" check also rejects negative indices.
using isize = i64;

// views
template <class T>
struct span;
template <class T>
struct span_split;

// optional results (try_pop_back, drain::next)
struct nullopt_t;
template <class T>
struct optional;

// containers
template <class T, isize N>
struct fixed_vector;
template <class T, class ContainerT>
struct drain;

// adapters
template <class T, isize N>
struct byte_writer;

namespace impl
{
template <class T, isize N>
struct inline_storage;
template <class T, class StorageT, class ContainerT>
struct sequence_engine;
} // namespace impl
} // namespace sa
