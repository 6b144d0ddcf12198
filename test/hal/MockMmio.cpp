// Simulated MMIO for host-side testing.
// Replaces hal/src/f1c100s/Mmio.cpp at link time.

#include "hal/Mmio.h"
#include "hal/F1c100sRegs.h"

#include "MockRegisters.h"

#include <gtest/gtest.h>

#include <cstdint>

namespace
{
    using namespace hal::regs;

    constexpr std::uint32_t kSdramWindow = 256U << 20;

    constexpr std::uint32_t kSctlrAddr = kDramcBase + kDramcSctlr;
    constexpr std::uint32_t kSconrAddr = kDramcBase + kDramcSconr;
    constexpr std::uint32_t kDdlyrAddr = kDramcBase + kDramcDdlyr;

    bool isSdram(std::uint32_t addr)
    {
        return addr >= kSdramBase && addr - kSdramBase < kSdramWindow;
    }

    bool isPllCtrl(std::uint32_t addr)
    {
        return addr == kCcuBase + kCcuPllCpuCtrl ||
               addr == kCcuBase + kCcuPllVideoCtrl ||
               addr == kCcuBase + kCcuPllDdrCtrl ||
               addr == kCcuBase + kCcuPllPeriphCtrl;
    }

    std::uint32_t lowMask(std::uint32_t bits)
    {
        return bits >= 32 ? 0xFFFFFFFFU : ((1U << bits) - 1U);
    }

    // Halfword address as seen by the controller: | bank | row | col |,
    // then folded onto the installed column/row widths.
    std::uint32_t dramCell(std::uint32_t addr)
    {
        std::uint32_t sconr = test::registerValue(kSconrAddr);
        std::uint32_t colCfg = kSconrCol.decode(sconr) + 1;
        std::uint32_t rowCfg = kSconrRow.decode(sconr) + 1;

        std::uint32_t half = (addr - kSdramBase) >> 1;
        std::uint32_t col = half & lowMask(colCfg);
        std::uint32_t row = (half >> colCfg) & lowMask(rowCfg);
        std::uint32_t bank = (half >> (colCfg + rowCfg)) & 0x3;

        col &= lowMask(test::g_sim.colBits);
        row &= lowMask(test::g_sim.rowBits);
        return col | (row << test::g_sim.colBits) |
               (bank << (test::g_sim.colBits + test::g_sim.rowBits));
    }

    std::uint32_t currentReadPipe()
    {
        return kSctlrReadPipe.decode(test::registerValue(kSctlrAddr));
    }

    void runDelayScan(std::uint32_t value)
    {
        std::uint32_t pipe = currentReadPipe();
        test::g_registers[kDdlyrAddr] =
            (value & ~(kDdlyrScan | kDdlyrStatus.mask())) |
            kDdlyrStatus.encode(test::g_sim.ddlyrStatus[pipe]);
        for (std::uint32_t i = 0; i < kDramcDrptrCount; ++i)
        {
            test::g_registers[kDramcBase + kDramcDrptr0 + 4 * i] =
                test::g_sim.delayPointers[pipe][i];
        }
    }

}  // namespace

namespace hal
{
    std::uint32_t mmioRead(std::uint32_t addr)
    {
        ++test::g_readCounts[addr];

        std::uint32_t value = 0;
        if (isSdram(addr))
        {
            auto it = test::g_dramCells.find(dramCell(addr));
            value = (it == test::g_dramCells.end()) ? 0 : it->second;

            if (test::g_sim.sdrGoodReadPipe >= 0 &&
                currentReadPipe() != static_cast<std::uint32_t>(test::g_sim.sdrGoodReadPipe))
            {
                value = ~value;
            }
        }
        else
        {
            value = test::registerValue(addr);
        }

        if (test::g_sim.poisonEnabled && addr == test::g_sim.poisonAddr)
        {
            value ^= 0x1;
        }
        return value;
    }

    void mmioWrite(std::uint32_t addr, std::uint32_t value)
    {
        if (test::g_mmioWritesForbidden)
        {
            ADD_FAILURE() << "unexpected MMIO write to 0x" << std::hex << addr;
        }
        test::g_mmioWrites.push_back({addr, value});

        if (isSdram(addr))
        {
            test::g_dramCells[dramCell(addr)] = value;
            return;
        }

        if (isPllCtrl(addr))
        {
            bool locks = (value & kPllEnable) != 0 &&
                         test::g_sim.pllNeverLocks.count(addr) == 0;
            value = locks ? (value | kPllLock) : (value & ~kPllLock);
        }
        else if (addr == kSctlrAddr)
        {
            if (!test::g_sim.controllerStartHangs)
            {
                value &= ~kSctlrInitial;
            }
        }
        else if (addr == kDdlyrAddr)
        {
            if ((value & kDdlyrScan) != 0 && !test::g_sim.delayScanHangs)
            {
                runDelayScan(value);
                return;
            }
        }

        test::g_registers[addr] = value;
    }

}  // namespace hal
