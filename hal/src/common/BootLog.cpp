// Portable boot log formatting.
//
// Contains no hardware addresses; output goes through the board hooks.

#include "hal/BootLog.h"
#include "hal/BootLogBoard.h"

#include <cstdint>

namespace hal
{
    void bootLog(const char *str)
    {
        while (*str)
        {
            boardLogPutChar(*str++);
        }
        boardLogFlush();
    }

    void bootLogHex(std::uint32_t value)
    {
        constexpr char kHexDigits[] = "0123456789ABCDEF";
        char buf[9];
        for (int i = 7; i >= 0; --i)
        {
            buf[i] = kHexDigits[value & 0xF];
            value >>= 4;
        }
        buf[8] = '\0';
        bootLog(buf);
    }

    void bootLogDec(std::uint32_t value)
    {
        // Integer-to-string (no sprintf in freestanding)
        char tmp[11];
        int len = 0;
        do
        {
            tmp[len++] = static_cast<char>('0' + value % 10);
            value /= 10;
        } while (value > 0);

        char buf[11];
        for (int i = 0; i < len; ++i)
        {
            buf[i] = tmp[len - 1 - i];
        }
        buf[len] = '\0';
        bootLog(buf);
    }

    void bootLogLine(const char *label, std::uint32_t value)
    {
        bootLog(label);
        bootLogDec(value);
        bootLog("\r\n");
    }

}  // namespace hal
