#pragma once
#include <memory>
#include <optional>
#include <QString>
#include "AudioFormat.h"

// FFmpeg decoder producing mono float32 at a fixed analysis sample rate.
class AudioDecoder {
public:
    AudioDecoder();
    ~AudioDecoder();

    AudioDecoder(const AudioDecoder&) = delete;
    AudioDecoder& operator=(const AudioDecoder&) = delete;

    bool open(const QString& filePath, int outSampleRate);
    void close();

    // Read mono float32 samples into buf. Returns frames actually read.
    int read(float* buf, int maxFrames);

    // Seek to a position in seconds. Samples before the target are discarded.
    bool seek(double secs);

    AudioStreamFormat format() const;
    QString errorString() const;

    // Decode [offset, offset + duration) of a file. The offset is pulled back
    // so a short file still yields a full window when it can.
    static std::optional<AudioExcerpt> readExcerpt(const QString& filePath,
                                                   int sampleRate,
                                                   double offsetSecs,
                                                   double durationSecs);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};
