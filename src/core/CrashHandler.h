#pragma once

#include <QString>

class CancellationToken;

class CrashHandler {
public:
    // SIGSEGV/SIGABRT/SIGFPE/SIGBUS write a backtrace to crash.log and exit
    static void install();
    static QString crashLogPath();

    // First SIGINT/SIGTERM cancels the token, the second one exits.
    // Pass nullptr to detach.
    static void setInterruptToken(CancellationToken* token);
};
