// Board-specific boot log output.
//
// Each board provides a blocking single-character sink. Called from the
// portable BootLog.cpp; must work with polling only (no interrupts).

#pragma once

namespace hal
{
    // Blocking single-character output.
    void boardLogPutChar(char c);

    // Wait for pending output to drain.
    void boardLogFlush();

}  // namespace hal
