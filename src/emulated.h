#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace eighty {

// Memory layout used when running the routines on a fresh machine
struct EmulatedLayout
{
    static constexpr uint16_t Stub = 0x0000;
    static constexpr uint16_t Routine = 0x0100;
    static constexpr uint16_t Source = 0x1000;
    static constexpr uint16_t Target = 0x5000;
    static constexpr size_t Window = 0x4000;
};

// Run the 8080 Capitalize routine over the first `length` bytes of `buffer`.
// Returns the number of cycles used.
// Throws routine_error if length exceeds the buffer or 255, and
// machine_error if the routine never halts.
uint32_t emulated_capitalize(std::span<uint8_t> buffer, size_t length);

// Run the 8080 memcpy routine. Returns the number of cycles used.
// Throws routine_error on the same conditions as copy_bytes(), or if count
// does not fit in the emulator's buffer window.
uint32_t emulated_copy_bytes(std::span<uint8_t const> source,
                             std::span<uint8_t> target, size_t count);

} // namespace eighty
