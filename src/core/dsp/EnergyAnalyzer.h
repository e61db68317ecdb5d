#pragma once

#include <vector>

struct EnergyResult {
    int energy = 0;             // 0-100
    double meanRms = 0.0;
    bool valid = false;
};

class EnergyAnalyzer {
public:
    static constexpr int kFrameSize = 2048;
    static constexpr int kHopSize = 512;

    // Mean short-time RMS scaled by 100 and clamped to 0-100
    static EnergyResult analyze(const std::vector<float>& samples);
};
