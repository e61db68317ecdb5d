#include "KeyEstimator.h"
#include "../MusicData.h"

#include <QDebug>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static constexpr int kBlockSize = 8192;

static const std::array<double, 12> kMajorProfile = {
    6.35, 2.23, 3.48, 2.33, 4.38, 4.09, 2.52, 5.19, 2.39, 3.66, 2.29, 2.88
};
static const std::array<double, 12> kMinorProfile = {
    6.33, 2.68, 3.52, 5.38, 2.60, 3.53, 2.54, 4.75, 3.98, 2.69, 3.34, 3.17
};

QString KeyResult::name() const
{
    if (!valid || pitchClass < 0 || pitchClass > 11)
        return QStringLiteral("Unknown");
    return kPitchClassNames.at(pitchClass);
}

// Pearson correlation of chroma against a profile rotated to `tonic`
static double correlate(const std::array<double, 12>& chroma,
                        const std::array<double, 12>& profile, int tonic)
{
    double meanX = 0.0, meanY = 0.0;
    for (int i = 0; i < 12; ++i) {
        meanX += chroma[size_t(i)];
        meanY += profile[size_t(i)];
    }
    meanX /= 12.0;
    meanY /= 12.0;

    double cov = 0.0, varX = 0.0, varY = 0.0;
    for (int i = 0; i < 12; ++i) {
        double x = chroma[size_t((i + tonic) % 12)] - meanX;
        double y = profile[size_t(i)] - meanY;
        cov += x * y;
        varX += x * x;
        varY += y * y;
    }
    if (varX <= 0.0 || varY <= 0.0)
        return 0.0;
    return cov / std::sqrt(varX * varY);
}

std::array<double, 12> KeyEstimator::chroma(const std::vector<float>& samples, int sampleRate)
{
    std::array<double, 12> result{};
    if (sampleRate <= 0 || samples.empty())
        return result;

    const int block = int(std::min<size_t>(samples.size(), size_t(kBlockSize)));
    std::vector<double> window(size_t(block));
    for (int i = 0; i < block; ++i)
        window[size_t(i)] = 0.5 - 0.5 * std::cos(2.0 * M_PI * i / std::max(1, block - 1));

    std::vector<double> buffer(size_t(block));
    for (size_t start = 0; start + size_t(block) <= samples.size(); start += size_t(block)) {
        for (int i = 0; i < block; ++i)
            buffer[size_t(i)] = samples[start + size_t(i)] * window[size_t(i)];

        for (int note = kLowestNote; note <= kHighestNote; ++note) {
            double freq = 440.0 * std::pow(2.0, (note - 69) / 12.0);
            if (freq >= sampleRate / 2.0)
                break;

            // Goertzel at the exact note frequency
            double coeff = 2.0 * std::cos(2.0 * M_PI * freq / sampleRate);
            double s1 = 0.0, s2 = 0.0;
            for (int i = 0; i < block; ++i) {
                double s0 = buffer[size_t(i)] + coeff * s1 - s2;
                s2 = s1;
                s1 = s0;
            }
            double power = s1 * s1 + s2 * s2 - coeff * s1 * s2;
            result[size_t(note % 12)] += std::sqrt(std::max(0.0, power));
        }
    }
    return result;
}

KeyResult KeyEstimator::estimate(const std::vector<float>& samples, int sampleRate)
{
    KeyResult result;

    std::array<double, 12> pcp = chroma(samples, sampleRate);
    double total = 0.0;
    for (double v : pcp) total += v;
    if (total <= 1e-9) {
        qDebug() << "[Key] No tonal energy in excerpt";
        return result;
    }

    double best = -2.0;
    for (int tonic = 0; tonic < 12; ++tonic) {
        double major = correlate(pcp, kMajorProfile, tonic);
        double minor = correlate(pcp, kMinorProfile, tonic);
        if (major > best) {
            best = major;
            result.pitchClass = tonic;
            result.minor = false;
        }
        if (minor > best) {
            best = minor;
            result.pitchClass = tonic;
            result.minor = true;
        }
    }

    result.correlation = best;
    result.valid = best > 0.0;
    return result;
}
