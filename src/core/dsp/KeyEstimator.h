#pragma once

#include <QString>
#include <array>
#include <vector>

struct KeyResult {
    int pitchClass = -1;        // 0 = C ... 11 = B
    bool minor = false;
    double correlation = 0.0;
    bool valid = false;

    QString name() const;       // pitch-class name, "Unknown" when invalid
};

// Krumhansl-Kessler profile matching on a Goertzel chroma vector.
class KeyEstimator {
public:
    static constexpr int kLowestNote = 36;    // C2
    static constexpr int kHighestNote = 95;   // B6

    static KeyResult estimate(const std::vector<float>& samples, int sampleRate);

    // Summed note magnitudes folded into 12 pitch classes
    static std::array<double, 12> chroma(const std::vector<float>& samples, int sampleRate);
};
