#include <gtest/gtest.h>

#include "hal/BootLog.h"

#include "MockRegisters.h"

class BootLogTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        test::resetMockState();
    }
};

TEST_F(BootLogTest, TextPassesThrough)
{
    hal::bootLog("DRAM: ok\r\n");
    EXPECT_EQ(test::g_logOutput, "DRAM: ok\r\n");
}

TEST_F(BootLogTest, HexIsEightUpperCaseDigits)
{
    hal::bootLogHex(0xDEADBEEF);
    hal::bootLog(" ");
    hal::bootLogHex(0x5C);
    EXPECT_EQ(test::g_logOutput, "DEADBEEF 0000005C");
}

TEST_F(BootLogTest, DecimalLimits)
{
    hal::bootLogDec(0);
    hal::bootLog(" ");
    hal::bootLogDec(4294967295u);
    EXPECT_EQ(test::g_logOutput, "0 4294967295");
}

TEST_F(BootLogTest, LineAppendsValueAndNewline)
{
    hal::bootLogLine("RCC: hclk ", 200000000);
    EXPECT_EQ(test::g_logOutput, "RCC: hclk 200000000\r\n");
}

TEST_F(BootLogTest, LoggingIsNotMmioTraffic)
{
    test::g_mmioWritesForbidden = true;
    hal::bootLogLine("DRAM: MB ", 64);
    EXPECT_TRUE(test::g_mmioWrites.empty());
}
