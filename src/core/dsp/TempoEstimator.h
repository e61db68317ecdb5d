#pragma once

#include <vector>

struct TempoResult {
    double bpm = 0.0;           // rounded to 0.1
    double confidence = 0.0;    // normalised autocorrelation at the chosen lag
    bool valid = false;
};

// Onset-envelope autocorrelation tempo estimate over 60-200 BPM,
// weighted towards 120 BPM.
class TempoEstimator {
public:
    static constexpr double kMinBpm = 60.0;
    static constexpr double kMaxBpm = 200.0;

    static TempoResult estimate(const std::vector<float>& samples, int sampleRate);

    // Half-wave rectified log-energy flux, one value per hop
    static std::vector<double> onsetEnvelope(const std::vector<float>& samples,
                                             int frameSize, int hopSize);
};
