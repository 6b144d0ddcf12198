// Mock boot log board hooks for host-side testing.
// Replaces hal/src/f1c100s/BootLogBoard.cpp at link time.
//
// boardLogPutChar() captures output into test::g_logOutput.

#include "hal/BootLogBoard.h"

#include "MockRegisters.h"

namespace hal
{
    void boardLogPutChar(char c)
    {
        test::g_logOutput.push_back(c);
    }

    void boardLogFlush()
    {
    }

}  // namespace hal
