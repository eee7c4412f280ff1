#include "routines.h"
#include "defines.h"

#include <fmt/format.h>

#include <functional>

namespace eighty {

void capitalize(uint8_t* buffer, size_t length)
{
    for (size_t i = 0; i < length; i++) {
        auto c = buffer[i];
        if (c >= 0x61 && c <= 0x7a) {
            buffer[i] = c - 0x20;
        }
    }
}

void capitalize(std::span<uint8_t> buffer, size_t length)
{
    if (length > buffer.size()) {
        throw routine_error(
            fmt::format("capitalize: length {} exceeds buffer of {} bytes",
                        length, buffer.size()));
    }
    capitalize(buffer.data(), length);
}

void capitalize(std::span<uint8_t> buffer)
{
    capitalize(buffer.data(), buffer.size());
}

void copy_bytes(uint8_t const* source, uint8_t* target, size_t count)
{
    if (count == 0) return;
    while (count > 0) {
        *target++ = *source++;
        count--;
    }
}

bool overlaps(uint8_t const* a, uint8_t const* b, size_t count)
{
    if (count == 0) return false;
    // Unrelated pointers only have a total order through std::less
    std::less<uint8_t const*> before;
    return before(a, b + count) && before(b, a + count);
}

void copy_bytes(std::span<uint8_t const> source, std::span<uint8_t> target,
                size_t count)
{
    if (count == 0) return;
    if (count > source.size()) {
        throw routine_error(
            fmt::format("copy_bytes: count {} exceeds source of {} bytes",
                        count, source.size()));
    }
    if (count > target.size()) {
        throw routine_error(
            fmt::format("copy_bytes: count {} exceeds target of {} bytes",
                        count, target.size()));
    }
    if (overlaps(source.data(), target.data(), count)) {
        throw routine_error("copy_bytes: source and target overlap");
    }
    copy_bytes(source.data(), target.data(), count);
}

} // namespace eighty
