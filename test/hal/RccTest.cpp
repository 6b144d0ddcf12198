#include <gtest/gtest.h>

#include "hal/F1c100sRegs.h"
#include "hal/Rcc.h"

#include "MockRegisters.h"

namespace
{
    using namespace hal::regs;

    constexpr std::uint32_t kCpuClkSrcAddr = kCcuBase + kCcuCpuClkSrc;
    constexpr std::uint32_t kAhbCfgAddr = kCcuBase + kCcuAhbApbHclkcCfg;
    constexpr std::uint32_t kPllCpuAddr = kCcuBase + kCcuPllCpuCtrl;
    constexpr std::uint32_t kPllVideoAddr = kCcuBase + kCcuPllVideoCtrl;
    constexpr std::uint32_t kPllPeriphAddr = kCcuBase + kCcuPllPeriphCtrl;

}  // namespace

class RccTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        test::resetMockState();
    }
};

// ---- PLL formulas ----

TEST_F(RccTest, PllCpuPresetsGiveNominalFrequency)
{
    EXPECT_EQ(hal::pllCpuFrequency(hal::kPllCpu720MHz), 720000000u);
    EXPECT_EQ(hal::pllCpuFrequency(hal::kPllCpu600MHz), 600000000u);
    EXPECT_EQ(hal::pllCpuFrequency(hal::kPllCpu408MHz), 408000000u);
}

TEST_F(RccTest, PllCpuOutputDividerApplies)
{
    hal::PllCpu pll{30, 1, 1, hal::PllCpuP::Div4};
    EXPECT_EQ(hal::pllCpuFrequency(pll), 180000000u);
}

TEST_F(RccTest, PllPeriphAndVideoPresets)
{
    EXPECT_EQ(hal::pllPeriphFrequency(hal::kPllPeriph600MHz), 600000000u);
    EXPECT_EQ(hal::pllVideoFrequency(hal::kPllVideo198MHz), 198000000u);
    EXPECT_EQ(hal::pllVideoFrequency(hal::kPllVideo270MHz), 270000000u);
    EXPECT_EQ(hal::pllVideoFrequency(hal::kPllVideo297MHz), 297000000u);
}

// ---- Derived clocks ----

TEST_F(RccTest, DefaultConfigComputesReferenceClocks)
{
    hal::ClockConfig config;
    hal::Clocks clocks = hal::rccComputeClocks(config);

    EXPECT_EQ(clocks.sysclk, 720000000u);
    EXPECT_EQ(clocks.hclk, 200000000u);
    EXPECT_EQ(clocks.pclk, 100000000u);
}

TEST_F(RccTest, ComputeClocksDoesNotTouchHardware)
{
    test::g_mmioWritesForbidden = true;
    hal::ClockConfig config;
    (void)hal::rccComputeClocks(config);

    EXPECT_TRUE(test::g_mmioWrites.empty());
}

TEST_F(RccTest, MissingCpuPllCountsAsOscillator)
{
    hal::ClockConfig config;
    config.hasPllCpu = false;
    config.ahbSource = hal::AhbClockSource::CpuClk;
    config.ahbDiv = hal::AhbDiv::Div2;

    hal::Clocks clocks = hal::rccComputeClocks(config);
    EXPECT_EQ(clocks.sysclk, hal::kOsc24MHz);
    EXPECT_EQ(clocks.hclk, 12000000u);
    EXPECT_EQ(clocks.pclk, 6000000u);
}

TEST_F(RccTest, DefaultClocksAreResetState)
{
    hal::Clocks clocks;
    EXPECT_EQ(clocks.sysclk, hal::kOsc24MHz);
    EXPECT_EQ(clocks.hclk, hal::kOsc24MHz);
    EXPECT_EQ(clocks.pclk, hal::kOsc24MHz);
}

// ---- Programming sequence ----

TEST_F(RccTest, InitReturnsComputedClocks)
{
    hal::ClockConfig config;
    hal::Clocks clocks = hal::rccInit(config);

    EXPECT_EQ(clocks.sysclk, 720000000u);
    EXPECT_EQ(clocks.hclk, 200000000u);
    EXPECT_EQ(clocks.pclk, 100000000u);
    EXPECT_NE(test::g_logOutput.find("RCC: sysclk 720000000\r\n"), std::string::npos);
}

TEST_F(RccTest, CpuMovesToOscillatorBeforeAnyPll)
{
    hal::ClockConfig config;
    hal::rccInit(config);

    std::vector<std::uint32_t> sources = test::writesTo(kCpuClkSrcAddr);
    ASSERT_GE(sources.size(), 2u);
    EXPECT_EQ(kCpuClkSrcSel.decode(sources.front()), 1u);

    std::size_t firstSrc = test::firstWriteIndex(kCpuClkSrcAddr);
    EXPECT_LT(firstSrc, test::firstWriteIndex(kPllVideoAddr));
    EXPECT_LT(firstSrc, test::firstWriteIndex(kPllPeriphAddr));
    EXPECT_LT(firstSrc, test::firstWriteIndex(kPllCpuAddr));
}

TEST_F(RccTest, CpuMovesToFinalSourceAfterCpuPll)
{
    hal::ClockConfig config;
    hal::rccInit(config);

    EXPECT_EQ(kCpuClkSrcSel.decode(test::registerValue(kCpuClkSrcAddr)), 2u);

    std::size_t lastSrc = 0;
    std::size_t lastPll = 0;
    for (std::size_t i = 0; i < test::g_mmioWrites.size(); ++i)
    {
        if (test::g_mmioWrites[i].addr == kCpuClkSrcAddr)
        {
            lastSrc = i;
        }
        if (test::g_mmioWrites[i].addr == kPllCpuAddr)
        {
            lastPll = i;
        }
    }
    EXPECT_GT(lastSrc, lastPll);
}

TEST_F(RccTest, BusDividersWrittenInOneAccess)
{
    hal::ClockConfig config;
    hal::rccInit(config);

    std::vector<std::uint32_t> writes = test::writesTo(kAhbCfgAddr);
    ASSERT_EQ(writes.size(), 1u);
    // AHB source PERIPH, pre-divider /3, AHB /1, APB /2, HCLKC /1
    EXPECT_EQ(writes[0], 0x00003180u);
    EXPECT_LT(test::firstWriteIndex(kAhbCfgAddr), test::firstWriteIndex(kPllCpuAddr));
}

TEST_F(RccTest, PllFactorsProgrammed)
{
    hal::ClockConfig config;
    hal::rccInit(config);

    std::uint32_t cpu = test::registerValue(kPllCpuAddr);
    EXPECT_NE(cpu & kPllEnable, 0u);
    EXPECT_EQ(kPllFactorN.decode(cpu), 29u);
    EXPECT_EQ(kPllFactorK.decode(cpu), 0u);
    EXPECT_EQ(kPllFactorM.decode(cpu), 0u);
    EXPECT_EQ(kPllCpuOutDivP.decode(cpu), 0u);

    std::uint32_t periph = test::registerValue(kPllPeriphAddr);
    EXPECT_EQ(kPllFactorN.decode(periph), 24u);

    std::uint32_t video = test::registerValue(kPllVideoAddr);
    EXPECT_NE(video & kPllVideoModeInteger, 0u);
    EXPECT_EQ(kPllVideoFactorN.decode(video), 65u);
    EXPECT_EQ(kPllVideoPreDivM.decode(video), 7u);
}

TEST_F(RccTest, FractionalVideoSelects297)
{
    hal::ClockConfig config;
    config.pllVideo = hal::kPllVideo297MHz;
    hal::rccInit(config);

    std::uint32_t video = test::registerValue(kPllVideoAddr);
    EXPECT_EQ(video & kPllVideoModeInteger, 0u);
    EXPECT_NE(video & kPllVideoFrac297, 0u);
    EXPECT_EQ(kPllVideoPreDivM.decode(video), 0u);
}

TEST_F(RccTest, AbsentPllIsLeftUntouched)
{
    hal::ClockConfig config;
    config.hasPllVideo = false;
    config.hasPllPeriph = false;
    hal::rccInit(config);

    EXPECT_TRUE(test::writesTo(kPllVideoAddr).empty());
    EXPECT_TRUE(test::writesTo(kPllPeriphAddr).empty());
    EXPECT_FALSE(test::writesTo(kPllCpuAddr).empty());
}

TEST_F(RccTest, DisplayEngineGatingOptional)
{
    hal::ClockConfig config;
    config.deDramGating = false;
    hal::rccInit(config);
    EXPECT_TRUE(test::writesTo(kCcuBase + kCcuDramGating).empty());

    test::resetMockState();
    config.deDramGating = true;
    hal::rccInit(config);
    EXPECT_EQ(test::registerValue(kCcuBase + kCcuDramGating),
              kFeDclkGating | kBeDclkGating);
}

TEST_F(RccTest, PllThatNeverLocksDoesNotStopInit)
{
    test::g_sim.pllNeverLocks.insert(kPllCpuAddr);

    hal::ClockConfig config;
    hal::Clocks clocks = hal::rccInit(config);

    EXPECT_GE(test::readCount(kPllCpuAddr), hal::kPllLockBudget);
    EXPECT_EQ(kCpuClkSrcSel.decode(test::registerValue(kCpuClkSrcAddr)), 2u);
    EXPECT_EQ(clocks.sysclk, 720000000u);
    EXPECT_NE(test::g_logOutput.find("RCC: PLL_CPU lock timeout"), std::string::npos);
}

// ---- SDRAM clock and reset ----

TEST_F(RccTest, SdramGateAndReset)
{
    hal::rccEnableSdramClock();
    EXPECT_EQ(test::registerValue(kCcuBase + kCcuBusClkGating0), kSdramGating);

    hal::rccSetSdramReset(false);
    EXPECT_EQ(test::registerValue(kCcuBase + kCcuBusSoftRst0), kSdramReset);

    hal::rccSetSdramReset(true);
    EXPECT_EQ(test::registerValue(kCcuBase + kCcuBusSoftRst0), 0u);

    hal::rccDisableSdramClock();
    EXPECT_EQ(test::registerValue(kCcuBase + kCcuBusClkGating0), 0u);
}
