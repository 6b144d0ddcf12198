// F1C100s clock tree (CCU): PLLs, bus dividers and SDRAM clock gating.
//
// rccInit() programs the clock tree once at boot and returns the derived
// bus frequencies. There is no global copy of the result: callers keep the
// returned Clocks and pass it to whatever needs bus frequencies.
//
// PLL formulas (24 MHz reference):
//   PLL_CPU    = 24 MHz * N * K / (M * P)
//   PLL_PERIPH = 24 MHz * N * K
//   PLL_VIDEO  = 24 MHz * N / M (integer) or 270 / 297 MHz (fractional)

#pragma once

#include <cstdint>

namespace hal
{
    constexpr std::uint32_t kOsc24MHz = 24000000;
    constexpr std::uint32_t kLosc32KHz = 32768;

    enum class CpuClockSource : std::uint8_t
    {
        Losc = 0,
        Osc24M = 1,
        PllCpu = 2
    };

    enum class AhbClockSource : std::uint8_t
    {
        Losc = 0,
        Osc24M = 1,
        CpuClk = 2,
        PllPeriph = 3    // PLL_PERIPH / AHB pre-divider
    };

    enum class AhbPreDiv : std::uint8_t
    {
        Div1 = 0,
        Div2 = 1,
        Div3 = 2,
        Div4 = 3
    };

    enum class AhbDiv : std::uint8_t
    {
        Div1 = 0,
        Div2 = 1,
        Div4 = 2,
        Div8 = 3
    };

    enum class ApbDiv : std::uint8_t
    {
        Div2 = 1,
        Div4 = 2,
        Div8 = 3
    };

    // HCLKC divider (from CPU clock)
    enum class HclkcDiv : std::uint8_t
    {
        Div1 = 0,
        Div2 = 1,
        Div3 = 2,
        Div4 = 3
    };

    // PLL_CPU output divider P
    enum class PllCpuP : std::uint8_t
    {
        Div1 = 0,
        Div2 = 1,
        Div4 = 2
    };

    struct PllCpu
    {
        std::uint8_t n;     // 1..32
        std::uint8_t k;     // 1..4
        std::uint8_t m;     // 1..4
        PllCpuP p;
    };

    struct PllPeriph
    {
        std::uint8_t n;     // 1..32
        std::uint8_t k;     // 1..4
    };

    enum class PllVideoMode : std::uint8_t
    {
        Integer = 0,
        Fractional
    };

    struct PllVideo
    {
        PllVideoMode mode;
        std::uint8_t n = 1;         // Integer mode: 1..128
        std::uint8_t m = 1;         // Integer mode: 1..16
        bool out297MHz = false;     // Fractional mode: 297 MHz, else 270 MHz
    };

    constexpr std::uint32_t pllCpuDivP(PllCpuP p)
    {
        switch (p)
        {
            case PllCpuP::Div2:
                return 2;
            case PllCpuP::Div4:
                return 4;
            default:
                break;
        }
        return 1;
    }

    constexpr std::uint32_t pllCpuFrequency(const PllCpu &pll)
    {
        return kOsc24MHz * static_cast<std::uint32_t>(pll.n) * pll.k /
               (static_cast<std::uint32_t>(pll.m) * pllCpuDivP(pll.p));
    }

    constexpr std::uint32_t pllPeriphFrequency(const PllPeriph &pll)
    {
        return kOsc24MHz * static_cast<std::uint32_t>(pll.n) * pll.k;
    }

    constexpr std::uint32_t pllVideoFrequency(const PllVideo &pll)
    {
        if (pll.mode == PllVideoMode::Fractional)
        {
            return pll.out297MHz ? 297000000U : 270000000U;
        }
        return kOsc24MHz * static_cast<std::uint32_t>(pll.n) / pll.m;
    }

    // Presets
    constexpr PllCpu kPllCpu720MHz{30, 1, 1, PllCpuP::Div1};
    constexpr PllCpu kPllCpu600MHz{25, 1, 1, PllCpuP::Div1};
    constexpr PllCpu kPllCpu408MHz{17, 1, 1, PllCpuP::Div1};
    constexpr PllPeriph kPllPeriph600MHz{25, 1};
    constexpr PllVideo kPllVideo198MHz{PllVideoMode::Integer, 66, 8, false};
    constexpr PllVideo kPllVideo270MHz{PllVideoMode::Fractional, 1, 1, false};
    constexpr PllVideo kPllVideo297MHz{PllVideoMode::Fractional, 1, 1, true};

    // Defaults reproduce the reference board setup:
    // CPU 720 MHz, PERIPH 600 MHz, VIDEO 198 MHz, AHB 200 MHz, APB 100 MHz.
    struct ClockConfig
    {
        // has* = false leaves that PLL untouched
        bool hasPllCpu = true;
        PllCpu pllCpu = kPllCpu720MHz;
        bool hasPllPeriph = true;
        PllPeriph pllPeriph = kPllPeriph600MHz;
        bool hasPllVideo = true;
        PllVideo pllVideo = kPllVideo198MHz;

        CpuClockSource cpuSource = CpuClockSource::PllCpu;
        AhbClockSource ahbSource = AhbClockSource::PllPeriph;
        AhbPreDiv ahbPreDiv = AhbPreDiv::Div3;
        AhbDiv ahbDiv = AhbDiv::Div1;
        ApbDiv apbDiv = ApbDiv::Div2;
        HclkcDiv hclkcDiv = HclkcDiv::Div1;

        // Display engine front-end/back-end DRAM clock gating
        bool deDramGating = true;
    };

    // Derived bus frequencies in Hz. Default value is the reset state.
    struct Clocks
    {
        std::uint32_t sysclk = kOsc24MHz;   // CPU clock
        std::uint32_t hclk = kOsc24MHz;     // AHB clock
        std::uint32_t pclk = kOsc24MHz;     // APB clock
    };

    // Program the clock tree. Call once, early, before any timing-sensitive
    // peripheral (including DRAM). PLL lock timeouts are not reported:
    // the bounded wait expires and programming continues.
    Clocks rccInit(const ClockConfig &config);

    // Frequencies the given configuration produces. No hardware access.
    Clocks rccComputeClocks(const ClockConfig &config);

    // Poll budget for CCU PLL lock bits.
    constexpr std::uint32_t kPllLockBudget = 0xFFFF;

    void rccEnableSdramClock();
    void rccDisableSdramClock();

    // Hold (true) or release (false) the SDRAM controller soft reset.
    void rccSetSdramReset(bool asserted);

}  // namespace hal
