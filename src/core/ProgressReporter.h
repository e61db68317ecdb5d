#pragma once

#include <QString>
#include <functional>

// percent 0-100, message, current item (1-based) and total; 0/0 when not applicable.
// May be left empty for headless runs.
using ProgressCallback = std::function<void(int percent, const QString& message,
                                            int current, int total)>;

// Wraps a ProgressCallback for one job: clamps percent to 0-100 and never
// lets it go backwards.
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressCallback callback = {});

    void report(int percent, const QString& message, int current = 0, int total = 0);

    // Map step/steps into the [from, to] percent band
    void reportRange(int from, int to, int step, int steps,
                     const QString& message, int current = 0, int total = 0);

    int lastPercent() const { return m_lastPercent; }

private:
    ProgressCallback m_callback;
    int m_lastPercent = 0;
};
