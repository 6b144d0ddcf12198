// F1C100s / F1C200s register map for clock and DRAM bring-up.
//
// Only the registers and fields the bring-up code touches are listed.
// Offsets and bit positions follow the F1C100s user manual (CCU, PIO) and
// the sunxi DRAMC layout shared with the sys-dram.c reference code.

#pragma once

#include "hal/Mmio.h"

#include <cstdint>

namespace hal
{
namespace regs
{
    // ---- Physical windows ----

    constexpr std::uint32_t kCcuBase = 0x01C20000;
    constexpr std::uint32_t kPioBase = 0x01C20800;
    constexpr std::uint32_t kDramcBase = 0x01C01000;
    constexpr std::uint32_t kUart0Base = 0x01C25000;
    constexpr std::uint32_t kSdramBase = 0x80000000;

    // Scratch word in SRAM A holding the "DRAM already up" marker.
    constexpr std::uint32_t kDramMarkerAddr = 0x0000005C;

    // ---- CCU ----

    constexpr std::uint32_t kCcuPllCpuCtrl = 0x000;
    constexpr std::uint32_t kCcuPllVideoCtrl = 0x010;
    constexpr std::uint32_t kCcuPllDdrCtrl = 0x020;
    constexpr std::uint32_t kCcuPllPeriphCtrl = 0x028;
    constexpr std::uint32_t kCcuCpuClkSrc = 0x050;
    constexpr std::uint32_t kCcuAhbApbHclkcCfg = 0x054;
    constexpr std::uint32_t kCcuBusClkGating0 = 0x060;
    constexpr std::uint32_t kCcuDramGating = 0x100;
    constexpr std::uint32_t kCcuPllStableTime0 = 0x200;
    constexpr std::uint32_t kCcuPllStableTime1 = 0x204;
    constexpr std::uint32_t kCcuPllDdrPatCtrl = 0x290;
    constexpr std::uint32_t kCcuBusSoftRst0 = 0x2C0;

    // PLL_xxx_CTRL bits shared by all PLLs
    constexpr std::uint32_t kPllEnable = 1U << 31;
    constexpr std::uint32_t kPllLock = 1U << 28;
    constexpr BitField kPllFactorM{0, 2};
    constexpr BitField kPllFactorK{4, 2};
    constexpr BitField kPllFactorN{8, 5};

    // PLL_CPU_CTRL
    constexpr BitField kPllCpuOutDivP{16, 2};

    // PLL_VIDEO_CTRL
    constexpr BitField kPllVideoPreDivM{0, 4};
    constexpr BitField kPllVideoFactorN{8, 7};
    constexpr std::uint32_t kPllVideoModeInteger = 1U << 24;
    constexpr std::uint32_t kPllVideoFrac297 = 1U << 25;

    // PLL_DDR_CTRL
    constexpr std::uint32_t kPllDdrUpdate = 1U << 20;
    constexpr std::uint32_t kPllDdrSdmEnable = 1U << 24;

    // PLL_STABLE_TIME0/1
    constexpr BitField kPllLockTime{0, 16};

    // CPU_CLK_SRC
    constexpr BitField kCpuClkSrcSel{16, 2};

    // AHB_APB_HCLKC_CFG
    constexpr BitField kAhbDivRatio{4, 2};
    constexpr BitField kAhbPreDiv{6, 2};
    constexpr BitField kApbRatio{8, 2};
    constexpr BitField kAhbSrcSel{12, 2};
    constexpr BitField kHclkcDiv{16, 2};

    // BUS_CLK_GATING0 / BUS_SOFT_RST0
    constexpr std::uint32_t kSdramGating = 1U << 14;
    constexpr std::uint32_t kSdramReset = 1U << 14;

    // DRAM_GATING (display engine front-end / back-end DRAM clocks)
    constexpr std::uint32_t kFeDclkGating = 1U << 24;
    constexpr std::uint32_t kBeDclkGating = 1U << 26;

    // ---- PIO ----

    constexpr std::uint32_t kPioPbCfg0 = 0x24;
    constexpr std::uint32_t kPioSdrPadDrv = 0x2C0;
    constexpr std::uint32_t kPioSdrPadPull = 0x2C4;

    constexpr BitField kPb3Select{12, 3};
    constexpr std::uint32_t kPb3FuncSdrDqs = 7;
    constexpr std::uint32_t kSdrPadModeDdr = 1U << 16;

    // ---- DRAMC ----

    constexpr std::uint32_t kDramcSconr = 0x00;   // Geometry / mode
    constexpr std::uint32_t kDramcStmg0r = 0x04;  // Timing 0
    constexpr std::uint32_t kDramcStmg1r = 0x08;  // Timing 1
    constexpr std::uint32_t kDramcSctlr = 0x0C;   // Control
    constexpr std::uint32_t kDramcSrefr = 0x10;   // Auto-refresh counter
    constexpr std::uint32_t kDramcDdlyr = 0x24;   // Delay scan
    constexpr std::uint32_t kDramcDrptr0 = 0x30;  // Delay pointers 0..3
    constexpr std::uint32_t kDramcDrptrCount = 4;

    // SCONR
    constexpr BitField kSconrRemap{0, 1};
    constexpr std::uint32_t kSconrFixed = 1U << 1;
    constexpr BitField kSconrBank{3, 1};
    constexpr BitField kSconrCs{4, 1};
    constexpr BitField kSconrRow{5, 4};
    constexpr BitField kSconrCol{9, 4};
    constexpr BitField kSconrBusWidth{13, 2};
    constexpr BitField kSconrAccessMode{15, 1};
    constexpr BitField kSconrType{16, 1};

    // SCTLR
    constexpr std::uint32_t kSctlrInitial = 1U << 0;
    constexpr BitField kSctlrReadPipe{6, 3};
    constexpr std::uint32_t kSctlrConfigEnable = 1U << 19;

    // DDLYR
    constexpr std::uint32_t kDdlyrScan = 1U << 0;
    constexpr BitField kDdlyrStatus{4, 2};

    // Self-clearing control bits are polled this many times.
    constexpr std::uint32_t kDramcPollBudget = 0xFFFFFF;

    // ---- Typed windows ----

    class CcuWindow : public RegisterWindow
    {
    public:
        constexpr CcuWindow()
            : RegisterWindow(kCcuBase)
        {
        }

        void setCpuClockSource(std::uint32_t sel) const
        {
            writeField(kCcuCpuClkSrc, kCpuClkSrcSel, sel);
        }

        std::uint32_t cpuClockSource() const
        {
            return readField(kCcuCpuClkSrc, kCpuClkSrcSel);
        }

        bool waitPllLock(std::uint32_t pllCtrl, std::uint32_t budget) const
        {
            return waitForSet(pllCtrl, kPllLock, budget);
        }
    };

    class PioWindow : public RegisterWindow
    {
    public:
        constexpr PioWindow()
            : RegisterWindow(kPioBase)
        {
        }

        void setSdrPadDdrMode(bool ddr) const
        {
            if (ddr)
            {
                setBits(kPioSdrPadPull, kSdrPadModeDdr);
            }
            else
            {
                clearBits(kPioSdrPadPull, kSdrPadModeDdr);
            }
        }
    };

    class DramcWindow : public RegisterWindow
    {
    public:
        constexpr DramcWindow()
            : RegisterWindow(kDramcBase)
        {
        }

        std::uint32_t readPipe() const
        {
            return readField(kDramcSctlr, kSctlrReadPipe);
        }

        void setReadPipe(std::uint32_t pipe) const
        {
            writeField(kDramcSctlr, kSctlrReadPipe, pipe);
        }

        // Kick the controller's initial sequence and wait for it to finish.
        bool runInitial() const
        {
            setBits(kDramcSctlr, kSctlrInitial);
            return waitForClear(kDramcSctlr, kSctlrInitial, kDramcPollBudget);
        }

        // Kick a DQS delay scan and wait for it to finish.
        bool runDelayScan() const
        {
            setBits(kDramcDdlyr, kDdlyrScan);
            return waitForClear(kDramcDdlyr, kDdlyrScan, kDramcPollBudget);
        }

        std::uint32_t delayScanStatus() const
        {
            return readField(kDramcDdlyr, kDdlyrStatus);
        }

        std::uint32_t delayPointer(std::uint32_t index) const
        {
            return read(kDramcDrptr0 + 4 * index);
        }
    };

}  // namespace regs
}  // namespace hal
