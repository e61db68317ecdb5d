#include "EnergyAnalyzer.h"

#include <algorithm>
#include <cmath>

EnergyResult EnergyAnalyzer::analyze(const std::vector<float>& samples)
{
    EnergyResult result;
    if (samples.empty())
        return result;

    // Excerpts shorter than one frame are measured as a single frame
    const size_t frame = std::min(samples.size(), size_t(kFrameSize));
    double rmsSum = 0.0;
    int frames = 0;
    for (size_t start = 0; start + frame <= samples.size(); start += size_t(kHopSize)) {
        double sumSq = 0.0;
        for (size_t i = 0; i < frame; ++i)
            sumSq += double(samples[start + i]) * samples[start + i];
        rmsSum += std::sqrt(sumSq / double(frame));
        ++frames;
    }

    result.meanRms = rmsSum / frames;
    result.energy = std::clamp(int(std::lround(result.meanRms * 100.0)), 0, 100);
    result.valid = true;
    return result;
}
