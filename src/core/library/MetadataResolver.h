#pragma once

#include "../MusicData.h"

#include <QStringList>

class Settings;

// Excerpt windows and switches for signal analysis
struct AnalysisConfig {
    bool   enabled = true;
    int    sampleRate = 22050;
    double tempoOffset = 30.0;
    double tempoDuration = 30.0;
    double keyOffset = 30.0;
    double keyDuration = 20.0;
    double energyOffset = 30.0;
    double energyDuration = 15.0;

    static AnalysisConfig fromSettings(const Settings* settings);
};

// Turns one audio file into a Track. Never throws: every failure ends up in
// Track::isCorrupt / Track::errorMessage or as an "unknown" analytic field.
class MetadataResolver {
public:
    static constexpr qint64 kMinFileSize = 1024;

    explicit MetadataResolver(const AnalysisConfig& config = AnalysisConfig());

    Track resolve(const QString& filePath) const;

    const AnalysisConfig& config() const { return m_config; }

    static const QStringList& supportedExtensions();
    static bool isSupportedFile(const QString& filePath);

private:
    void analyze(Track& track, bool needBpm, bool needKey) const;

    AnalysisConfig m_config;
};
