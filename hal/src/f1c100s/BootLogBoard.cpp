// F1C100s boot log output on UART0 (PE1 TX).
//
// Polled writes to the 16550-style THR. The UART is set up by the debug
// console driver. Before that happens (e.g. while the clock tree is being
// programmed) LSR never reports THR empty, so each poll is bounded and the
// character is dropped on expiry.
//
// Direct register access so that log output never shows up as MMIO
// traffic of the bring-up code.

#include "hal/BootLogBoard.h"
#include "hal/F1c100sRegs.h"

#include <cstdint>

namespace
{
    using hal::regs::kUart0Base;

    constexpr std::uint32_t kUartThr = kUart0Base + 0x00;  // Transmit holding
    constexpr std::uint32_t kUartLsr = kUart0Base + 0x14;  // Line status

    constexpr std::uint32_t kLsrThre = 1U << 5;   // THR empty
    constexpr std::uint32_t kLsrTemt = 1U << 6;   // Transmitter empty

    // ~1 character time at 115200 baud on a 720 MHz core, with margin
    constexpr std::uint32_t kPollBudget = 100000;

    volatile std::uint32_t &reg(std::uint32_t addr)
    {
        return *reinterpret_cast<volatile std::uint32_t *>(
            static_cast<std::uintptr_t>(addr));
    }

    bool waitLsr(std::uint32_t mask)
    {
        for (std::uint32_t i = 0; i < kPollBudget; ++i)
        {
            if ((reg(kUartLsr) & mask) != 0)
            {
                return true;
            }
        }
        return false;
    }

}  // namespace

namespace hal
{
    void boardLogPutChar(char c)
    {
        if (!waitLsr(kLsrThre))
        {
            return;
        }
        reg(kUartThr) = static_cast<std::uint32_t>(static_cast<std::uint8_t>(c));
    }

    void boardLogFlush()
    {
        for (std::uint32_t i = 0; i < kPollBudget && (reg(kUartLsr) & kLsrTemt) == 0; ++i)
        {
        }
    }

}  // namespace hal
