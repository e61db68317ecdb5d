#include "CrashHandler.h"
#include "CancellationToken.h"

#include <atomic>
#include <csignal>
#include <cstring>
#include <execinfo.h>
#include <fcntl.h>
#include <unistd.h>

#include <QStandardPaths>
#include <QDir>

static char s_crashLogPath[512] = {0};
static std::atomic<CancellationToken*> s_interruptToken{nullptr};
static volatile sig_atomic_t s_interruptCount = 0;

static void writeString(int fd, const char* s)
{
    ssize_t n = write(fd, s, strlen(s));
    (void)n;
}

static void crashSignalHandler(int sig)
{
    const char* name = "UNKNOWN";
    switch (sig) {
        case SIGSEGV: name = "SIGSEGV"; break;
        case SIGABRT: name = "SIGABRT"; break;
        case SIGFPE:  name = "SIGFPE";  break;
        case SIGBUS:  name = "SIGBUS";  break;
    }

    int fd = open(s_crashLogPath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd >= 0) {
        writeString(fd, "CrateBridge Crash Report\nSignal: ");
        writeString(fd, name);
        writeString(fd, "\n\nBacktrace:\n");

        void* frames[64];
        int count = backtrace(frames, 64);
        backtrace_symbols_fd(frames, count, fd);

        close(fd);
    }

    _exit(128 + sig);
}

static void interruptSignalHandler(int sig)
{
    CancellationToken* token = s_interruptToken.load();
    if (token && s_interruptCount == 0) {
        s_interruptCount = 1;
        token->cancel();
        writeString(STDERR_FILENO, "\nCanceling... (press Ctrl+C again to quit)\n");
        return;
    }
    _exit(128 + sig);
}

void CrashHandler::install()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dir);
    QString path = dir + QStringLiteral("/crash.log");
    strncpy(s_crashLogPath, path.toUtf8().constData(), sizeof(s_crashLogPath) - 1);

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = crashSignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;  // one-shot

    sigaction(SIGSEGV, &sa, nullptr);
    sigaction(SIGABRT, &sa, nullptr);
    sigaction(SIGFPE,  &sa, nullptr);
    sigaction(SIGBUS,  &sa, nullptr);
}

QString CrashHandler::crashLogPath()
{
    return QString::fromUtf8(s_crashLogPath);
}

void CrashHandler::setInterruptToken(CancellationToken* token)
{
    s_interruptToken.store(token);
    s_interruptCount = 0;

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = token ? interruptSignalHandler : SIG_DFL;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT,  &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}
