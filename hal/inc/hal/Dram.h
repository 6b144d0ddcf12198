// F1C100s / F1C200s DDR1 controller bring-up (DRAMC at 0x01C01000).
//
// dramInit() brings up the in-package DRAM: it programs PLL_DDR, resets and
// configures the controller, probes whether the memory answers as SDR or
// DDR, calibrates the read pipe, detects the real column/row widths by
// address aliasing and finally verifies a 512-byte window.
//
// On success the size is recorded in a marker word at 0x5C ('X' in the top
// byte). Later calls see the marker and return immediately without touching
// hardware, so every boot path may call dramInit() unconditionally.
//
// Must run after rccInit(). Single context, polling only.

#pragma once

#include "hal/Mmio.h"
#include "hal/Rcc.h"

#include <cstdint>

namespace hal
{
    enum class DramChip : std::uint8_t
    {
        F1C100S = 0,    // 32 MB DDR1
        F1C200S         // 64 MB DDR1
    };

    enum class DramType : std::uint8_t
    {
        Sdr = 0,
        Ddr = 1
    };

    enum class DramStatus : std::uint8_t
    {
        Ok = 0,
        InitTimeout,        // Controller start bit never self-cleared
        DelayScanTimeout,   // Delay scan bit never self-cleared
        VerifyFailed        // Read-back mismatch after geometry detection
    };

    struct DramConfig
    {
        DramChip chip = DramChip::F1C200S;
        std::uint32_t pllDdrHz = 156000000;

        // CAS latency in bits 0..3. Bit 3 adds the pad pull-up; bits 4..7
        // select a PLL_DDR sigma-delta pattern (lowest set bit wins).
        std::uint32_t cas = 0x3;

        // PLL_DDR lock poll budget. kWaitForever waits without limit.
        // A finite budget that expires is not an error.
        std::uint32_t pllLockTimeout = kWaitForever;
    };

    struct DramInfo
    {
        std::uint32_t base;
        std::uint32_t sizeMb;
    };

    // Fields that make up the controller's SCONR register.
    struct DramGeometry
    {
        std::uint32_t ddr8Remap = 0;
        std::uint32_t bankSize = 4;     // 2 or 4 banks
        std::uint32_t csNum = 1;        // 1 or 2 chip selects
        std::uint32_t rowWidth = 13;    // address bits, 1..16
        std::uint32_t colWidth = 10;    // address bits, 1..16
        std::uint32_t busWidth = 16;    // DDR: 8/16/32, SDR: 16/32
        std::uint32_t accessMode = 1;
        DramType type = DramType::Ddr;
    };

    // Working parameters of one bring-up run.
    struct DramPara
    {
        std::uint32_t base;
        std::uint32_t size;     // MB
        std::uint32_t clk;      // MHz
        std::uint32_t cas;      // CAS latency / feature bits
        DramGeometry geometry;
    };

    DramStatus dramInit(const DramConfig &config, const Clocks &clocks,
                        DramInfo &info);

    const char *dramStatusName(DramStatus status);

    // SCONR encoding. dramDecodeGeometry(dramEncodeGeometry(g)) == g for
    // every geometry within the documented ranges.
    std::uint32_t dramEncodeGeometry(const DramGeometry &geometry);
    DramGeometry dramDecodeGeometry(std::uint32_t sconr);

    // Auto-refresh counter for the SCONR row field (row width - 1) and a
    // clock value. Reproduces the controller's quantisation loop.
    std::uint32_t dramAutoRefreshCycles(std::uint32_t rowField, std::uint32_t clk);

    // Installed size in MB for the detected geometry.
    std::uint32_t dramSizeMb(std::uint32_t rowWidth, std::uint32_t colWidth);

    // One bring-up run. Each method is one step of the sequence and must be
    // called in declaration order; dramInit() stops at the first failure.
    class DramBringup
    {
    public:
        DramBringup(const DramConfig &config, const Clocks &clocks);

        DramStatus configurePads();
        DramStatus startPll();
        DramStatus resetController();
        DramStatus applyPadMode();
        DramStatus programTiming();
        DramStatus setupController();
        DramStatus detectType();
        DramStatus updateAutoRefresh();
        DramStatus calibrateReadPipe();
        DramStatus detectGeometry();
        DramStatus verify();

        const DramPara &para() const;

    private:
        void delayMs(std::uint32_t ms) const;
        DramStatus calibrateDdr();
        DramStatus calibrateSdr();
        bool sdrRampRoundTrips() const;
        bool aliases(std::uint32_t first, std::uint32_t second,
                     std::uint32_t firstPattern, std::uint32_t secondPattern) const;

        DramPara m_para;
        std::uint32_t m_pllLockTimeout;
        std::uint32_t m_loopsPerMs;
    };

}  // namespace hal
