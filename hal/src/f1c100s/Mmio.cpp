// F1C100s raw register access.
//
// Direct volatile loads and stores on the ARM926 physical address space.
// The MMU is off during bring-up, so physical == virtual.

#include "hal/Mmio.h"

#include <cstdint>

namespace
{
    volatile std::uint32_t &reg(std::uint32_t addr)
    {
        return *reinterpret_cast<volatile std::uint32_t *>(
            static_cast<std::uintptr_t>(addr));
    }
}  // namespace

namespace hal
{
    std::uint32_t mmioRead(std::uint32_t addr)
    {
        return reg(addr);
    }

    void mmioWrite(std::uint32_t addr, std::uint32_t value)
    {
        reg(addr) = value;
    }

}  // namespace hal
