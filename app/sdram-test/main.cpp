// SDRAM bring-up test for F1C100s / F1C200s boards
//
// Programs the clock tree, brings up DRAM, then runs pattern tests over the
// first 32 MB. Results are printed on UART0 (115200 8N1, set up by the
// debug console before main).
//
// No interrupts, no heap: runs straight from SRAM.

#include "hal/BootLog.h"
#include "hal/Dram.h"
#include "hal/MemTest.h"
#include "hal/Rcc.h"

#include <cstdint>

namespace
{
    constexpr std::uint32_t kSeqWords = 1024;   // 4 KB
    constexpr std::uint32_t kAltWords = 256;    // 1 KB
    constexpr std::uint32_t kOffsetsMb[] = {0, 8, 16, 24};

    void printResult(const char *testName, bool pass)
    {
        hal::bootLog(testName);
        hal::bootLog(pass ? ": PASS\r\n" : ": FAIL\r\n");
    }

    void halt()
    {
        while (true)
        {
        }
    }

}  // namespace

int main()
{
    hal::ClockConfig clockConfig;
    hal::Clocks clocks = hal::rccInit(clockConfig);

    hal::bootLog("\r\n=== SDRAM Test ===\r\n");

    hal::DramConfig dramConfig;
    hal::DramInfo info{};
    hal::DramStatus status = hal::dramInit(dramConfig, clocks, info);
    if (status != hal::DramStatus::Ok)
    {
        hal::bootLog("Init DRAM: FAIL (");
        hal::bootLog(hal::dramStatusName(status));
        hal::bootLog(")\r\n");
        halt();
    }
    hal::bootLogLine("Init DRAM: OK, MB ", info.sizeMb);

    printResult("Walk1", hal::memTestWalkingOnes(info.base));
    printResult("Seq 4K", hal::memTestSequential(info.base, kSeqWords));
    printResult("Alt 1K", hal::memTestAlternating(info.base, kAltWords));

    for (std::uint32_t offsetMb : kOffsetsMb)
    {
        hal::bootLog("Seq@+");
        hal::bootLogDec(offsetMb);
        printResult("M", hal::memTestSequential(info.base + (offsetMb << 20), kSeqWords));
    }

    hal::bootLog("=== Done ===\r\n");
    halt();
}
