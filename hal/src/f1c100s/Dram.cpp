// F1C100s / F1C200s DDR1 bring-up.
//
// Timing constants are tuned for a 156 MHz DDR clock. The geometry given by
// the chip variant is only a starting guess: column and row widths are
// re-detected by writing two patterns that alias onto each other when the
// controller decodes one address bit more than the device has.
//
// DRAMC address decode (halfword address): | bank | row | column |
//
// Constraints: no heap, no exceptions, no interrupts.

#include "hal/Dram.h"
#include "hal/BootLog.h"
#include "hal/F1c100sRegs.h"
#include "hal/Mmio.h"
#include "hal/Rcc.h"

#include <cstdint>

namespace
{
    using namespace hal::regs;

    constexpr PioWindow kPio;
    constexpr DramcWindow kDramc;
    constexpr CcuWindow kCcu;

    constexpr std::uint32_t kMarkerTag = 'X';
    constexpr std::uint32_t kMarkerSizeMask = 0x00FFFFFF;

    constexpr std::uint32_t kReadPipeCount = 8;

    // sdelay() loop count per millisecond is 2000 at 720 MHz
    constexpr std::uint32_t kCpuHzPerDelayLoop = 360000;

    // SDR pad drive / pull
    constexpr std::uint32_t kPadDrvDefault = 0x7U << 12;
    constexpr std::uint32_t kPadDrvMid = 0xAAA;
    constexpr std::uint32_t kPadDrvMax = 0xFFF;
    constexpr std::uint32_t kPadPullCas3 = (0x1U << 23) | (0x20U << 17);

    // PLL_DDR sigma-delta patterns, selected by CAS bits 4..7
    constexpr std::uint32_t kCasPatternMask = 0xFU << 4;
    constexpr std::uint32_t kPllDdrPatterns[] = {
        0xD1303333,
        0xCCE06666,
        0xC8909999,
        0xC440CCCC,
    };

    // STMG0R / STMG1R fields for 156 MHz
    constexpr std::uint32_t kTCas = 0x2;
    constexpr std::uint32_t kTRas = 0x8;
    constexpr std::uint32_t kTRcd = 0x3;
    constexpr std::uint32_t kTRp = 0x3;
    constexpr std::uint32_t kTWr = 0x3;
    constexpr std::uint32_t kTRfc = 0xD;
    constexpr std::uint32_t kTXsr = 0xF9;
    constexpr std::uint32_t kTRc = 0xB;
    constexpr std::uint32_t kTInit = 0x8;
    constexpr std::uint32_t kTInitRef = 0x7;
    constexpr std::uint32_t kTWtr = 0x2;
    constexpr std::uint32_t kTRrd = 0x2;
    constexpr std::uint32_t kTXp = 0x0;

    // Geometry probes
    constexpr std::uint32_t kProbeWords = 32;
    constexpr std::uint32_t kColProbeLow = 0x200;
    constexpr std::uint32_t kColProbeHigh = 0x600;
    constexpr std::uint32_t kRowProbeCol10Low = 0x00400000;
    constexpr std::uint32_t kRowProbeCol10High = 0x00C00000;
    constexpr std::uint32_t kRowProbeCol9Low = 0x00200000;
    constexpr std::uint32_t kRowProbeCol9High = 0x00600000;

    constexpr std::uint32_t kVerifyWords = 128;

    // Auto-refresh quantisation
    constexpr std::uint32_t kRowField13 = 0xC;
    constexpr std::uint32_t kRowField12 = 0xB;
    constexpr std::uint32_t kRefreshClkBoundary = 1000000;
    constexpr std::uint32_t kRefreshBase = 10000000;

    using DramStep = hal::DramStatus (hal::DramBringup::*)();

    constexpr DramStep kSteps[] = {
        &hal::DramBringup::configurePads,
        &hal::DramBringup::startPll,
        &hal::DramBringup::resetController,
        &hal::DramBringup::applyPadMode,
        &hal::DramBringup::programTiming,
        &hal::DramBringup::setupController,
        &hal::DramBringup::detectType,
        &hal::DramBringup::applyPadMode,
        &hal::DramBringup::updateAutoRefresh,
        &hal::DramBringup::calibrateReadPipe,
        &hal::DramBringup::detectGeometry,
        &hal::DramBringup::verify,
    };

    std::uint32_t bitCount(std::uint32_t value)
    {
        std::uint32_t count = 0;
        while (value != 0)
        {
            value &= value - 1;
            ++count;
        }
        return count;
    }

    std::uint32_t delayPointerScore(std::uint32_t busWidth)
    {
        std::uint32_t regs = (busWidth == 16) ? kDramcDrptrCount : 2;
        std::uint32_t score = 0;
        for (std::uint32_t i = 0; i < regs; ++i)
        {
            score += bitCount(kDramc.delayPointer(i));
        }
        return score;
    }

    void logFailure(const char *what)
    {
        hal::bootLog("DRAM: ");
        hal::bootLog(what);
        hal::bootLog("\r\n");
    }

}  // namespace

namespace hal
{
    // ---- Pure helpers ----

    std::uint32_t dramEncodeGeometry(const DramGeometry &geometry)
    {
        std::uint32_t busShift = (geometry.type != DramType::Sdr)
                                     ? (geometry.busWidth >> 4)
                                     : (geometry.busWidth >> 5);

        return kSconrRemap.encode(geometry.ddr8Remap) |
               kSconrFixed |
               kSconrBank.encode(geometry.bankSize >> 2) |
               kSconrCs.encode(geometry.csNum >> 1) |
               kSconrRow.encode(geometry.rowWidth - 1) |
               kSconrCol.encode(geometry.colWidth - 1) |
               kSconrBusWidth.encode(busShift) |
               kSconrAccessMode.encode(geometry.accessMode) |
               kSconrType.encode(static_cast<std::uint32_t>(geometry.type));
    }

    DramGeometry dramDecodeGeometry(std::uint32_t sconr)
    {
        DramGeometry geometry;
        geometry.ddr8Remap = kSconrRemap.decode(sconr);
        geometry.bankSize = kSconrBank.decode(sconr) ? 4 : 2;
        geometry.csNum = kSconrCs.decode(sconr) ? 2 : 1;
        geometry.rowWidth = kSconrRow.decode(sconr) + 1;
        geometry.colWidth = kSconrCol.decode(sconr) + 1;
        geometry.accessMode = kSconrAccessMode.decode(sconr);
        geometry.type = kSconrType.decode(sconr) ? DramType::Ddr : DramType::Sdr;

        std::uint32_t busShift = kSconrBusWidth.decode(sconr);
        if (geometry.type == DramType::Ddr)
        {
            geometry.busWidth = (busShift == 0) ? 8 : (busShift << 4);
        }
        else
        {
            geometry.busWidth = (busShift + 1) << 4;
        }
        return geometry;
    }

    std::uint32_t dramAutoRefreshCycles(std::uint32_t rowField, std::uint32_t clk)
    {
        std::uint32_t threshold = 0;
        std::uint32_t smallClkShift = 0;
        if (rowField == kRowField13)
        {
            threshold = kRefreshBase >> 6;
            smallClkShift = 6;
        }
        else if (rowField == kRowField12)
        {
            threshold = kRefreshBase >> 7;
            smallClkShift = 5;
        }
        else
        {
            return 0;
        }

        if (clk < kRefreshClkBoundary)
        {
            return (clk * 499) >> smallClkShift;
        }

        // Counted down the way the refresh counter consumes cycles
        std::uint32_t val = 0;
        std::uint32_t temp = clk + (clk >> 3) + (clk >> 4) + (clk >> 5);
        while (temp >= threshold)
        {
            temp -= threshold;
            ++val;
        }
        return val;
    }

    std::uint32_t dramSizeMb(std::uint32_t rowWidth, std::uint32_t colWidth)
    {
        if (rowWidth != 13)
        {
            return 16;
        }
        if (colWidth == 10)
        {
            return 64;
        }
        return 32;
    }

    const char *dramStatusName(DramStatus status)
    {
        switch (status)
        {
            case DramStatus::Ok:
                return "ok";
            case DramStatus::InitTimeout:
                return "init timeout";
            case DramStatus::DelayScanTimeout:
                return "delay scan timeout";
            case DramStatus::VerifyFailed:
                return "verify failed";
            default:
                break;
        }
        return "unknown";
    }

    // ---- DramBringup ----

    DramBringup::DramBringup(const DramConfig &config, const Clocks &clocks)
        : m_para{},
          m_pllLockTimeout(config.pllLockTimeout),
          m_loopsPerMs(clocks.sysclk / kCpuHzPerDelayLoop)
    {
        if (m_loopsPerMs == 0)
        {
            m_loopsPerMs = 1;
        }

        m_para.base = kSdramBase;
        m_para.size = (config.chip == DramChip::F1C100S) ? 32 : 64;
        m_para.clk = config.pllDdrHz / 1000000;
        m_para.cas = config.cas;
        m_para.geometry = DramGeometry{};
    }

    const DramPara &DramBringup::para() const
    {
        return m_para;
    }

    void DramBringup::delayMs(std::uint32_t ms) const
    {
        spinDelay(ms * m_loopsPerMs);
    }

    DramStatus DramBringup::configurePads()
    {
        // PB3 carries SDR_DQS
        kPio.writeField(kPioPbCfg0, kPb3Select, kPb3FuncSdrDqs);

        kPio.setBits(kPioSdrPadDrv, kPadDrvDefault);
        delayMs(5);

        if ((m_para.cas >> 3) & 0x1)
        {
            kPio.setBits(kPioSdrPadPull, kPadPullCas3);
        }

        if (m_para.clk >= 144 && m_para.clk <= 180)
        {
            kPio.write(kPioSdrPadDrv, kPadDrvMid);
        }
        if (m_para.clk >= 180)
        {
            kPio.write(kPioSdrPadDrv, kPadDrvMax);
        }
        return DramStatus::Ok;
    }

    DramStatus DramBringup::startPll()
    {
        // PLL_DDR runs at twice the DRAM clock
        std::uint32_t val = kPllEnable;
        if (m_para.clk <= 96)
        {
            val |= kPllFactorM.encode(1) | kPllFactorN.encode((m_para.clk * 2) / 12 - 1);
        }
        else
        {
            val |= kPllFactorM.encode(0) | kPllFactorN.encode((m_para.clk * 2) / 24 - 1);
        }

        for (std::uint32_t i = 0; i < 4; ++i)
        {
            if (m_para.cas & (0x1U << (4 + i)))
            {
                kCcu.write(kCcuPllDdrPatCtrl, kPllDdrPatterns[i]);
                break;
            }
        }

        if (m_para.cas & kCasPatternMask)
        {
            val |= kPllDdrSdmEnable;
        }

        kCcu.write(kCcuPllDdrCtrl, val);
        kCcu.setBits(kCcuPllDdrCtrl, kPllDdrUpdate);

        if (!kCcu.waitPllLock(kCcuPllDdrCtrl, m_pllLockTimeout))
        {
            // Not fatal, same as the CCU PLLs
            logFailure("PLL_DDR lock timeout");
        }
        delayMs(5);
        return DramStatus::Ok;
    }

    DramStatus DramBringup::resetController()
    {
        rccEnableSdramClock();
        rccSetSdramReset(true);
        spinDelay(20);
        rccSetSdramReset(false);
        return DramStatus::Ok;
    }

    DramStatus DramBringup::applyPadMode()
    {
        kPio.setSdrPadDdrMode(m_para.geometry.type == DramType::Ddr);
        return DramStatus::Ok;
    }

    DramStatus DramBringup::programTiming()
    {
        kDramc.write(kDramcStmg0r,
                     (kTCas << 0) | (kTRas << 3) | (kTRcd << 7) | (kTRp << 10) |
                     (kTWr << 13) | (kTRfc << 15) | (kTXsr << 19) | (kTRc << 28));
        kDramc.write(kDramcStmg1r,
                     (kTInit << 0) | (kTInitRef << 16) | (kTWtr << 20) |
                     (kTRrd << 22) | (kTXp << 25));
        return DramStatus::Ok;
    }

    DramStatus DramBringup::setupController()
    {
        kDramc.write(kDramcSconr, dramEncodeGeometry(m_para.geometry));
        kDramc.setBits(kDramcSctlr, kSctlrConfigEnable);
        if (!kDramc.runInitial())
        {
            logFailure("controller start timeout");
            return DramStatus::InitTimeout;
        }
        return DramStatus::Ok;
    }

    DramStatus DramBringup::detectType()
    {
        // SDR parts flag a delay error on every read pipe setting
        std::uint32_t errors = 0;
        for (std::uint32_t pipe = 0; pipe < kReadPipeCount; ++pipe)
        {
            kDramc.setReadPipe(pipe);
            if (!kDramc.runDelayScan())
            {
                logFailure("delay scan timeout");
                return DramStatus::DelayScanTimeout;
            }
            if (kDramc.delayScanStatus() != 0)
            {
                ++errors;
            }
        }

        m_para.geometry.type = (errors == kReadPipeCount) ? DramType::Sdr : DramType::Ddr;
        bootLog(m_para.geometry.type == DramType::Ddr ? "DRAM: DDR\r\n" : "DRAM: SDR\r\n");
        return DramStatus::Ok;
    }

    DramStatus DramBringup::updateAutoRefresh()
    {
        std::uint32_t rowField = kDramc.readField(kDramcSconr, kSconrRow);
        kDramc.write(kDramcSrefr, dramAutoRefreshCycles(rowField, m_para.clk));
        return DramStatus::Ok;
    }

    DramStatus DramBringup::calibrateReadPipe()
    {
        if (m_para.geometry.type == DramType::Ddr)
        {
            return calibrateDdr();
        }
        return calibrateSdr();
    }

    DramStatus DramBringup::calibrateDdr()
    {
        // Highest delay pointer score wins; ties keep the lower pipe
        std::uint32_t best = 0;
        std::uint32_t bestScore = 0;
        for (std::uint32_t pipe = 0; pipe < kReadPipeCount; ++pipe)
        {
            kDramc.setReadPipe(pipe);
            if (!kDramc.runDelayScan())
            {
                logFailure("delay scan timeout");
                return DramStatus::DelayScanTimeout;
            }

            std::uint32_t score = 0;
            if (kDramc.delayScanStatus() == 0)
            {
                score = delayPointerScore(m_para.geometry.busWidth);
            }
            if (score > bestScore)
            {
                bestScore = score;
                best = pipe;
            }
        }

        kDramc.setReadPipe(best);
        if (!kDramc.runDelayScan())
        {
            logFailure("delay scan timeout");
            return DramStatus::DelayScanTimeout;
        }
        bootLogLine("DRAM: read pipe ", best);
        return DramStatus::Ok;
    }

    DramStatus DramBringup::calibrateSdr()
    {
        kDramc.clearBits(kDramcSconr, kSconrType.mask() | kSconrBusWidth.mask());

        std::uint32_t best = 0;
        for (std::uint32_t pipe = 0; pipe < kReadPipeCount; ++pipe)
        {
            kDramc.setReadPipe(pipe);
            if (sdrRampRoundTrips())
            {
                best = pipe;
                break;
            }
        }

        kDramc.setReadPipe(best);
        bootLogLine("DRAM: read pipe ", best);
        return DramStatus::Ok;
    }

    bool DramBringup::sdrRampRoundTrips() const
    {
        for (std::uint32_t k = 0; k < kProbeWords; ++k)
        {
            mmioWrite(m_para.base + 4 * k, k);
        }
        for (std::uint32_t k = 0; k < kProbeWords; ++k)
        {
            if (mmioRead(m_para.base + 4 * k) != k)
            {
                return false;
            }
        }
        return true;
    }

    bool DramBringup::aliases(std::uint32_t first, std::uint32_t second,
                              std::uint32_t firstPattern,
                              std::uint32_t secondPattern) const
    {
        for (std::uint32_t i = 0; i < kProbeWords; ++i)
        {
            mmioWrite(first + 4 * i, firstPattern);
            mmioWrite(second + 4 * i, secondPattern);
        }

        std::uint32_t count = 0;
        for (std::uint32_t i = 0; i < kProbeWords; ++i)
        {
            if (mmioRead(first + 4 * i) == secondPattern)
            {
                ++count;
            }
        }
        return count == kProbeWords;
    }

    DramStatus DramBringup::detectGeometry()
    {
        DramGeometry &geometry = m_para.geometry;

        // Start from the widest layout and recalibrate for it
        geometry.colWidth = 10;
        geometry.rowWidth = 13;
        DramStatus status = setupController();
        if (status != DramStatus::Ok)
        {
            return status;
        }
        status = calibrateReadPipe();
        if (status != DramStatus::Ok)
        {
            return status;
        }

        bool colAliases = aliases(m_para.base + kColProbeLow,
                                  m_para.base + kColProbeHigh,
                                  0x11111111, 0x22222222);
        geometry.colWidth = colAliases ? 9 : 10;

        status = setupController();
        if (status != DramStatus::Ok)
        {
            return status;
        }

        std::uint32_t rowLow = (geometry.colWidth == 10) ? kRowProbeCol10Low : kRowProbeCol9Low;
        std::uint32_t rowHigh = (geometry.colWidth == 10) ? kRowProbeCol10High : kRowProbeCol9High;
        bool rowAliases = aliases(m_para.base + rowLow, m_para.base + rowHigh,
                                  0x33333333, 0x44444444);
        geometry.rowWidth = rowAliases ? 12 : 13;

        m_para.size = dramSizeMb(geometry.rowWidth, geometry.colWidth);
        bootLogLine("DRAM: col ", geometry.colWidth);
        bootLogLine("DRAM: row ", geometry.rowWidth);

        // SCONR still holds the probe row width here
        status = updateAutoRefresh();
        if (status != DramStatus::Ok)
        {
            return status;
        }
        geometry.accessMode = 0;
        return setupController();
    }

    DramStatus DramBringup::verify()
    {
        for (std::uint32_t i = 0; i < kVerifyWords; ++i)
        {
            std::uint32_t addr = m_para.base + 4 * i;
            mmioWrite(addr, addr);
        }
        for (std::uint32_t i = 0; i < kVerifyWords; ++i)
        {
            std::uint32_t addr = m_para.base + 4 * i;
            if (mmioRead(addr) != addr)
            {
                bootLog("DRAM: verify mismatch at ");
                bootLogHex(addr);
                bootLog("\r\n");
                return DramStatus::VerifyFailed;
            }
        }
        return DramStatus::Ok;
    }

    // ---- Entry point ----

    DramStatus dramInit(const DramConfig &config, const Clocks &clocks,
                        DramInfo &info)
    {
        std::uint32_t marker = mmioRead(kDramMarkerAddr);
        if ((marker >> 24) == kMarkerTag)
        {
            info.base = kSdramBase;
            info.sizeMb = marker & kMarkerSizeMask;
            bootLogLine("DRAM: already up, MB ", info.sizeMb);
            return DramStatus::Ok;
        }

        DramBringup bringup(config, clocks);
        for (DramStep step : kSteps)
        {
            DramStatus status = (bringup.*step)();
            if (status != DramStatus::Ok)
            {
                bootLog("DRAM: init failed: ");
                bootLog(dramStatusName(status));
                bootLog("\r\n");
                return status;
            }
        }

        const DramPara &para = bringup.para();
        mmioWrite(kDramMarkerAddr, (kMarkerTag << 24) | para.size);
        info.base = para.base;
        info.sizeMb = para.size;
        bootLogLine("DRAM: MB ", para.size);
        return DramStatus::Ok;
    }

}  // namespace hal
