#pragma once
#include <cstdint>
#include <vector>

// Output format of a decoder after resampling
struct AudioStreamFormat {
    int      sampleRate    = 22050;
    int      channels      = 1;
    int      sourceSampleRate = 0;
    int      sourceChannels   = 0;
    int64_t  totalFrames   = 0;
    double   durationSecs  = 0.0;
};

// Mono float samples of one bounded window of a file
struct AudioExcerpt {
    std::vector<float> samples;
    int    sampleRate = 0;
    double offsetSecs = 0.0;        // where the window starts in the file
    double fileDurationSecs = 0.0;
};
