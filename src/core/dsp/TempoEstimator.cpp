#include "TempoEstimator.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

static constexpr int kFrameSize = 1024;
static constexpr int kHopSize = 256;
static constexpr double kPriorCenterBpm = 120.0;
static constexpr double kPriorWidthOctaves = 1.0;

std::vector<double> TempoEstimator::onsetEnvelope(const std::vector<float>& samples,
                                                  int frameSize, int hopSize)
{
    std::vector<double> onset;
    if (frameSize <= 0 || hopSize <= 0 || samples.size() < size_t(frameSize))
        return onset;

    const size_t frames = (samples.size() - size_t(frameSize)) / size_t(hopSize) + 1;
    onset.reserve(frames);

    double prev = 0.0;
    for (size_t f = 0; f < frames; ++f) {
        const float* p = samples.data() + f * size_t(hopSize);
        double energy = 0.0;
        for (int i = 0; i < frameSize; ++i)
            energy += double(p[i]) * p[i];
        double logEnergy = std::log1p(1000.0 * energy / frameSize);
        onset.push_back(f == 0 ? 0.0 : std::max(0.0, logEnergy - prev));
        prev = logEnergy;
    }
    return onset;
}

TempoResult TempoEstimator::estimate(const std::vector<float>& samples, int sampleRate)
{
    TempoResult result;
    if (sampleRate <= 0)
        return result;

    std::vector<double> onset = onsetEnvelope(samples, kFrameSize, kHopSize);
    const double frameRate = double(sampleRate) / kHopSize;
    const int minLag = std::max(1, int(std::floor(60.0 * frameRate / kMaxBpm)));
    const int maxLag = int(std::ceil(60.0 * frameRate / kMinBpm));

    // Need at least two periods of the slowest tempo
    if (onset.size() < size_t(2 * maxLag + 2)) {
        qDebug() << "[Tempo] Excerpt too short:" << onset.size() << "onset frames";
        return result;
    }

    double mean = 0.0;
    for (double v : onset) mean += v;
    mean /= double(onset.size());
    for (double& v : onset) v -= mean;

    double zeroLag = 0.0;
    for (double v : onset) zeroLag += v * v;
    if (zeroLag <= 1e-12) {
        qDebug() << "[Tempo] Flat onset envelope";
        return result;
    }

    // Weighted autocorrelation, one slot per lag (with a guard on each side)
    std::vector<double> score(size_t(maxLag + 2), 0.0);
    std::vector<double> acf(size_t(maxLag + 2), 0.0);
    for (int lag = std::max(1, minLag - 1); lag <= maxLag + 1; ++lag) {
        double sum = 0.0;
        for (size_t i = size_t(lag); i < onset.size(); ++i)
            sum += onset[i] * onset[i - size_t(lag)];
        acf[size_t(lag)] = sum / zeroLag;

        double bpm = 60.0 * frameRate / lag;
        double octaves = std::log2(bpm / kPriorCenterBpm) / kPriorWidthOctaves;
        score[size_t(lag)] = acf[size_t(lag)] * std::exp(-0.5 * octaves * octaves);
    }

    int bestLag = -1;
    for (int lag = minLag; lag <= maxLag; ++lag) {
        if (bestLag < 0 || score[size_t(lag)] > score[size_t(bestLag)])
            bestLag = lag;
    }
    if (bestLag < 0 || score[size_t(bestLag)] <= 0.0) {
        qDebug() << "[Tempo] No periodicity found";
        return result;
    }

    // Parabolic refinement around the peak
    double lag = bestLag;
    double a = score[size_t(bestLag - 1)];
    double b = score[size_t(bestLag)];
    double c = score[size_t(bestLag + 1)];
    double denom = a - 2.0 * b + c;
    if (std::abs(denom) > 1e-12) {
        double shift = 0.5 * (a - c) / denom;
        if (std::abs(shift) < 1.0)
            lag += shift;
    }

    double bpm = 60.0 * frameRate / lag;
    bpm = std::clamp(bpm, kMinBpm, kMaxBpm);

    result.bpm = std::round(bpm * 10.0) / 10.0;
    result.confidence = acf[size_t(bestLag)];
    result.valid = true;
    return result;
}
