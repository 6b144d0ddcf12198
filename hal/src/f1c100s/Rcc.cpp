// F1C100s clock tree programming (CCU at 0x01C20000).
//
// Sequence (order matters):
//  1. PLL lock stable times
//  2. CPU onto the 24 MHz oscillator before any PLL is touched
//  3. PLL_VIDEO, 4. PLL_PERIPH (each followed by a bounded lock wait)
//  5. AHB/APB/HCLKC dividers and AHB source in one write: dividers must be
//     in place before the source that uses them is switched
//  6. Display engine DRAM clock gating
//  7. PLL_CPU, then 8. CPU onto its final source

#include "hal/Rcc.h"
#include "hal/BootLog.h"
#include "hal/F1c100sRegs.h"

#include <cstdint>

namespace
{
    using namespace hal::regs;

    constexpr std::uint32_t kPllStableTime = 0x1FF;
    constexpr std::uint32_t kSettleLoops = 100;
    constexpr std::uint32_t kCpuSrcOsc24M = 0x1;

    constexpr CcuWindow kCcu;

    std::uint32_t ahbPreDivValue(hal::AhbPreDiv div)
    {
        return static_cast<std::uint32_t>(div) + 1;
    }

    std::uint32_t ahbDivValue(hal::AhbDiv div)
    {
        return 1U << static_cast<std::uint32_t>(div);
    }

    std::uint32_t apbDivValue(hal::ApbDiv div)
    {
        return 1U << static_cast<std::uint32_t>(div);
    }

    void waitPllLock(std::uint32_t pllCtrl, const char *name)
    {
        if (!kCcu.waitPllLock(pllCtrl, hal::kPllLockBudget))
        {
            // Not fatal: carry on with whatever the PLL produces
            hal::bootLog("RCC: ");
            hal::bootLog(name);
            hal::bootLog(" lock timeout\r\n");
        }
    }

    void configurePllVideo(const hal::PllVideo &pll)
    {
        std::uint32_t val = kPllEnable;
        if (pll.mode == hal::PllVideoMode::Integer)
        {
            val |= kPllVideoModeInteger;
            val |= kPllVideoFactorN.encode(pll.n - 1U);
            val |= kPllVideoPreDivM.encode(pll.m - 1U);
        }
        else
        {
            // Fractional mode: pre-divider M must be 0
            if (pll.out297MHz)
            {
                val |= kPllVideoFrac297;
            }
        }
        kCcu.write(kCcuPllVideoCtrl, val);
        hal::spinDelay(kSettleLoops);
        waitPllLock(kCcuPllVideoCtrl, "PLL_VIDEO");
    }

    void configurePllPeriph(const hal::PllPeriph &pll)
    {
        // M = 1 (normal output)
        kCcu.write(kCcuPllPeriphCtrl,
                   kPllEnable |
                   kPllFactorN.encode(pll.n - 1U) |
                   kPllFactorK.encode(pll.k - 1U) |
                   kPllFactorM.encode(0));
        hal::spinDelay(kSettleLoops);
        waitPllLock(kCcuPllPeriphCtrl, "PLL_PERIPH");
    }

    void configurePllCpu(const hal::PllCpu &pll)
    {
        kCcu.modify(kCcuPllCpuCtrl,
                    kPllCpuOutDivP.mask() | kPllFactorN.mask() |
                    kPllFactorK.mask() | kPllFactorM.mask(),
                    kPllEnable |
                    kPllCpuOutDivP.encode(static_cast<std::uint32_t>(pll.p)) |
                    kPllFactorN.encode(pll.n - 1U) |
                    kPllFactorK.encode(pll.k - 1U) |
                    kPllFactorM.encode(pll.m - 1U));
        waitPllLock(kCcuPllCpuCtrl, "PLL_CPU");
    }

}  // namespace

namespace hal
{
    Clocks rccInit(const ClockConfig &config)
    {
        kCcu.write(kCcuPllStableTime0, kPllLockTime.encode(kPllStableTime));
        kCcu.write(kCcuPllStableTime1, kPllLockTime.encode(kPllStableTime));

        // Safe source while the PLLs are reprogrammed
        kCcu.setCpuClockSource(kCpuSrcOsc24M);
        spinDelay(kSettleLoops);

        if (config.hasPllVideo)
        {
            configurePllVideo(config.pllVideo);
        }

        if (config.hasPllPeriph)
        {
            configurePllPeriph(config.pllPeriph);
        }

        kCcu.write(kCcuAhbApbHclkcCfg,
                   kHclkcDiv.encode(static_cast<std::uint32_t>(config.hclkcDiv)) |
                   kAhbSrcSel.encode(static_cast<std::uint32_t>(config.ahbSource)) |
                   kApbRatio.encode(static_cast<std::uint32_t>(config.apbDiv)) |
                   kAhbPreDiv.encode(static_cast<std::uint32_t>(config.ahbPreDiv)) |
                   kAhbDivRatio.encode(static_cast<std::uint32_t>(config.ahbDiv)));
        spinDelay(kSettleLoops);

        if (config.deDramGating)
        {
            kCcu.setBits(kCcuDramGating, kFeDclkGating | kBeDclkGating);
            spinDelay(kSettleLoops);
        }

        if (config.hasPllCpu)
        {
            configurePllCpu(config.pllCpu);
        }

        kCcu.setCpuClockSource(static_cast<std::uint32_t>(config.cpuSource));
        spinDelay(kSettleLoops);

        Clocks clocks = rccComputeClocks(config);
        bootLogLine("RCC: sysclk ", clocks.sysclk);
        bootLogLine("RCC: hclk ", clocks.hclk);
        bootLogLine("RCC: pclk ", clocks.pclk);
        return clocks;
    }

    Clocks rccComputeClocks(const ClockConfig &config)
    {
        Clocks clocks;

        switch (config.cpuSource)
        {
            case CpuClockSource::Losc:
                clocks.sysclk = kLosc32KHz;
                break;
            case CpuClockSource::PllCpu:
                clocks.sysclk = config.hasPllCpu ? pllCpuFrequency(config.pllCpu)
                                                 : kOsc24MHz;
                break;
            default:
                clocks.sysclk = kOsc24MHz;
                break;
        }

        std::uint32_t pllPeriphHz = config.hasPllPeriph
                                        ? pllPeriphFrequency(config.pllPeriph)
                                        : kOsc24MHz;

        std::uint32_t ahbInput = kOsc24MHz;
        switch (config.ahbSource)
        {
            case AhbClockSource::Losc:
                ahbInput = kLosc32KHz;
                break;
            case AhbClockSource::CpuClk:
                ahbInput = clocks.sysclk;
                break;
            case AhbClockSource::PllPeriph:
                ahbInput = pllPeriphHz / ahbPreDivValue(config.ahbPreDiv);
                break;
            default:
                ahbInput = kOsc24MHz;
                break;
        }

        clocks.hclk = ahbInput / ahbDivValue(config.ahbDiv);
        clocks.pclk = clocks.hclk / apbDivValue(config.apbDiv);
        return clocks;
    }

    void rccEnableSdramClock()
    {
        kCcu.setBits(kCcuBusClkGating0, kSdramGating);
    }

    void rccDisableSdramClock()
    {
        kCcu.clearBits(kCcuBusClkGating0, kSdramGating);
    }

    void rccSetSdramReset(bool asserted)
    {
        // BUS_SOFT_RST bits are active low
        if (asserted)
        {
            kCcu.clearBits(kCcuBusSoftRst0, kSdramReset);
        }
        else
        {
            kCcu.setBits(kCcuBusSoftRst0, kSdramReset);
        }
    }

}  // namespace hal
