// Memory-mapped register access primitive.
//
// mmioRead()/mmioWrite() are the only functions in the bring-up code that
// touch physical addresses. hal/src/f1c100s/Mmio.cpp implements them with
// volatile loads and stores; host tests link test/hal/MockMmio.cpp instead,
// which backs them with a simulated register file and DRAM array.
//
// RegisterWindow is a view over one fixed register bank. Offsets passed to
// its methods are relative to the bank base.
//
// The one other volatile access is the UART0 boot log output in
// hal/src/f1c100s/BootLogBoard.cpp, kept off this layer so that log output
// never shows up as bring-up MMIO traffic.
//
// Thread safety: none. Bring-up runs once from a single context.

#pragma once

#include <cstdint>

namespace hal
{
    std::uint32_t mmioRead(std::uint32_t addr);
    void mmioWrite(std::uint32_t addr, std::uint32_t value);

    // Busy-wait for the given number of loop iterations.
    void spinDelay(std::uint32_t loops);

    // Poll budget meaning "wait until the condition holds, however long".
    constexpr std::uint32_t kWaitForever = 0;

    struct BitField
    {
        std::uint8_t shift;
        std::uint8_t width;

        constexpr std::uint32_t mask() const
        {
            return (width >= 32 ? 0xFFFFFFFFU : ((1U << width) - 1U)) << shift;
        }

        constexpr std::uint32_t encode(std::uint32_t value) const
        {
            return (value << shift) & mask();
        }

        constexpr std::uint32_t decode(std::uint32_t regValue) const
        {
            return (regValue & mask()) >> shift;
        }
    };

    class RegisterWindow
    {
    public:
        constexpr explicit RegisterWindow(std::uint32_t base)
            : m_base(base)
        {
        }

        constexpr std::uint32_t base() const
        {
            return m_base;
        }

        std::uint32_t read(std::uint32_t offset) const;
        void write(std::uint32_t offset, std::uint32_t value) const;

        // Read-modify-write: clears clearMask, then sets setMask.
        void modify(std::uint32_t offset, std::uint32_t clearMask,
                    std::uint32_t setMask) const;
        void setBits(std::uint32_t offset, std::uint32_t mask) const;
        void clearBits(std::uint32_t offset, std::uint32_t mask) const;

        std::uint32_t readField(std::uint32_t offset, BitField field) const;
        void writeField(std::uint32_t offset, BitField field,
                        std::uint32_t value) const;

        // Poll until all bits in mask read as set (or clear).
        // Reads at most `budget` times; kWaitForever polls without limit.
        // Returns false if the budget ran out.
        bool waitForSet(std::uint32_t offset, std::uint32_t mask,
                        std::uint32_t budget) const;
        bool waitForClear(std::uint32_t offset, std::uint32_t mask,
                          std::uint32_t budget) const;

    private:
        std::uint32_t m_base;
    };

}  // namespace hal
