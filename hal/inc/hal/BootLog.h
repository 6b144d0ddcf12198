// Polled boot-time log output.
//
// Formats text and numbers and hands each character to the board output
// hooks (BootLogBoard.h). Safe before interrupts, heap or DRAM exist:
// no heap, no exceptions, no printf.

#pragma once

#include <cstdint>

namespace hal
{
    void bootLog(const char *str);

    // Eight upper-case hex digits, no prefix.
    void bootLogHex(std::uint32_t value);

    void bootLogDec(std::uint32_t value);

    // "label" followed by a decimal value and "\r\n".
    void bootLogLine(const char *label, std::uint32_t value);

}  // namespace hal
