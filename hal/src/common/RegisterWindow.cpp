// Portable register window helpers built on mmioRead()/mmioWrite().

#include "hal/Mmio.h"

#include <cstdint>

namespace hal
{
    void spinDelay(std::uint32_t loops)
    {
        for (volatile std::uint32_t i = 0; i < loops; ++i)
        {
        }
    }

    std::uint32_t RegisterWindow::read(std::uint32_t offset) const
    {
        return mmioRead(m_base + offset);
    }

    void RegisterWindow::write(std::uint32_t offset, std::uint32_t value) const
    {
        mmioWrite(m_base + offset, value);
    }

    void RegisterWindow::modify(std::uint32_t offset, std::uint32_t clearMask,
                                std::uint32_t setMask) const
    {
        std::uint32_t val = read(offset);
        val &= ~clearMask;
        val |= setMask;
        write(offset, val);
    }

    void RegisterWindow::setBits(std::uint32_t offset, std::uint32_t mask) const
    {
        modify(offset, 0, mask);
    }

    void RegisterWindow::clearBits(std::uint32_t offset, std::uint32_t mask) const
    {
        modify(offset, mask, 0);
    }

    std::uint32_t RegisterWindow::readField(std::uint32_t offset, BitField field) const
    {
        return field.decode(read(offset));
    }

    void RegisterWindow::writeField(std::uint32_t offset, BitField field,
                                    std::uint32_t value) const
    {
        modify(offset, field.mask(), field.encode(value));
    }

    bool RegisterWindow::waitForSet(std::uint32_t offset, std::uint32_t mask,
                                    std::uint32_t budget) const
    {
        std::uint32_t remaining = budget;
        while ((read(offset) & mask) != mask)
        {
            if (budget != kWaitForever && --remaining == 0)
            {
                return false;
            }
        }
        return true;
    }

    bool RegisterWindow::waitForClear(std::uint32_t offset, std::uint32_t mask,
                                      std::uint32_t budget) const
    {
        std::uint32_t remaining = budget;
        while ((read(offset) & mask) != 0)
        {
            if (budget != kWaitForever && --remaining == 0)
            {
                return false;
            }
        }
        return true;
    }

}  // namespace hal
