#include "ProgressReporter.h"

#include <QtGlobal>

ProgressReporter::ProgressReporter(ProgressCallback callback)
    : m_callback(std::move(callback))
{
}

void ProgressReporter::report(int percent, const QString& message, int current, int total)
{
    percent = qBound(0, percent, 100);
    if (percent < m_lastPercent)
        percent = m_lastPercent;
    m_lastPercent = percent;

    if (m_callback)
        m_callback(percent, message, current, total);
}

void ProgressReporter::reportRange(int from, int to, int step, int steps,
                                   const QString& message, int current, int total)
{
    int percent = to;
    if (steps > 0)
        percent = from + static_cast<int>(static_cast<qint64>(to - from) * step / steps);
    report(percent, message, current, total);
}
