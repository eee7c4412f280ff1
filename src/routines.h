#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace eighty {

// Upper-case the ASCII letters a-z among the first `length` bytes of
// `buffer`. Everything else, including bytes past `length`, is left alone.
// No bounds checking.
void capitalize(uint8_t* buffer, size_t length);

// As above, but throws routine_error if `length` is larger than the buffer.
void capitalize(std::span<uint8_t> buffer, size_t length);

void capitalize(std::span<uint8_t> buffer);

// Copy `count` bytes forward, one at a time. A zero count touches nothing.
// The regions must not overlap. No bounds checking.
void copy_bytes(uint8_t const* source, uint8_t* target, size_t count);

// Throws routine_error if `count` exceeds either region or the regions
// overlap. Nothing is written in that case.
void copy_bytes(std::span<uint8_t const> source, std::span<uint8_t> target,
                size_t count);

// True if [a, a+count) and [b, b+count) share any byte
bool overlaps(uint8_t const* a, uint8_t const* b, size_t count);

} // namespace eighty
