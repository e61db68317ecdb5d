#include "MetadataResolver.h"
#include "../Settings.h"
#include "../audio/AudioDecoder.h"
#include "../audio/TagReader.h"
#include "../dsp/EnergyAnalyzer.h"
#include "../dsp/KeyEstimator.h"
#include "../dsp/TempoEstimator.h"

#include <QDebug>
#include <QFileInfo>
#include <QUuid>

#include <algorithm>

AnalysisConfig AnalysisConfig::fromSettings(const Settings* settings)
{
    AnalysisConfig c;
    if (!settings) return c;
    c.enabled        = settings->analysisEnabled();
    c.sampleRate     = settings->analysisSampleRate();
    c.tempoOffset    = settings->tempoOffset();
    c.tempoDuration  = settings->tempoDuration();
    c.keyOffset      = settings->keyOffset();
    c.keyDuration    = settings->keyDuration();
    c.energyOffset   = settings->energyOffset();
    c.energyDuration = settings->energyDuration();
    return c;
}

MetadataResolver::MetadataResolver(const AnalysisConfig& config)
    : m_config(config)
{
}

const QStringList& MetadataResolver::supportedExtensions()
{
    static const QStringList exts = {
        QStringLiteral("mp3"), QStringLiteral("wav"), QStringLiteral("flac"),
        QStringLiteral("m4a"), QStringLiteral("aac")
    };
    return exts;
}

bool MetadataResolver::isSupportedFile(const QString& filePath)
{
    return supportedExtensions().contains(QFileInfo(filePath).suffix().toLower());
}

static Track corruptTrack(const QString& filePath, const QString& reason)
{
    Track t = Track::defaults(filePath);
    t.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    t.isCorrupt = true;
    t.errorMessage = reason;
    return t;
}

Track MetadataResolver::resolve(const QString& filePath) const
{
    // ── Cheap corruption signals ────────────────────────────────────
    QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isFile())
        return corruptTrack(filePath, QStringLiteral("File does not exist"));
    if (!fi.isReadable())
        return corruptTrack(filePath, QStringLiteral("File is not readable"));
    if (fi.size() < kMinFileSize)
        return corruptTrack(filePath, QStringLiteral("File too small (%1 bytes)").arg(fi.size()));

    // ── Container tags ──────────────────────────────────────────────
    TagData tags = TagReader::read(filePath);
    if (!tags.valid) {
        qDebug() << "[Resolver]" << tags.errorMessage << filePath;
        return corruptTrack(filePath, tags.errorMessage);
    }

    Track track = Track::defaults(filePath);
    track.id       = QUuid::createUuid().toString(QUuid::WithoutBraces);
    track.title    = tags.title;
    track.artist   = tags.artist;
    track.album    = tags.album;
    track.genre    = tags.genre;
    track.year     = tags.year;
    track.comment  = tags.comment;
    track.duration = tags.duration;
    track.bpm      = tags.bpm;
    if (auto key = normalizeKey(tags.key))
        track.key = *key;
    else if (!tags.key.isEmpty())
        qDebug() << "[Resolver] Unusable key tag" << tags.key << "in" << filePath;

    // ── Signal analysis (tags take precedence) ──────────────────────
    if (m_config.enabled)
        analyze(track, track.bpm <= 0.0, track.key == QLatin1String("Unknown"));

    track.applyDefaults();
    return track;
}

struct Window {
    double offset;
    double duration;
};

static Window clampWindow(double offset, double duration, double fileDuration)
{
    Window w{std::max(0.0, offset), std::max(0.0, duration)};
    if (fileDuration > 0.0)
        w.offset = std::min(w.offset, std::max(0.0, fileDuration - w.duration));
    return w;
}

static std::vector<float> slice(const AudioExcerpt& excerpt, const Window& w)
{
    const size_t total = excerpt.samples.size();
    double rel = std::max(0.0, w.offset - excerpt.offsetSecs);
    size_t begin = std::min(total, size_t(rel * excerpt.sampleRate));
    size_t end = std::min(total, begin + size_t(w.duration * excerpt.sampleRate));
    return std::vector<float>(excerpt.samples.begin() + long(begin),
                              excerpt.samples.begin() + long(end));
}

void MetadataResolver::analyze(Track& track, bool needBpm, bool needKey) const
{
    const double fileDuration = track.duration;
    const Window tempoWin  = clampWindow(m_config.tempoOffset, m_config.tempoDuration, fileDuration);
    const Window keyWin    = clampWindow(m_config.keyOffset, m_config.keyDuration, fileDuration);
    const Window energyWin = clampWindow(m_config.energyOffset, m_config.energyDuration, fileDuration);

    // One decode covering every window that is needed
    double lo = energyWin.offset;
    double hi = energyWin.offset + energyWin.duration;
    if (needBpm) {
        lo = std::min(lo, tempoWin.offset);
        hi = std::max(hi, tempoWin.offset + tempoWin.duration);
    }
    if (needKey) {
        lo = std::min(lo, keyWin.offset);
        hi = std::max(hi, keyWin.offset + keyWin.duration);
    }

    std::optional<AudioExcerpt> excerpt =
        AudioDecoder::readExcerpt(track.filePath, m_config.sampleRate, lo, hi - lo);
    if (!excerpt) {
        qDebug() << "[Resolver] Analysis unavailable for" << track.filePath;
        return;
    }

    if (track.duration <= 0.0)
        track.duration = excerpt->fileDurationSecs;

    // Windows were computed before the duration was known
    auto place = [&](const Window& w) {
        if (fileDuration > 0.0) return w;
        return clampWindow(w.offset, w.duration, excerpt->fileDurationSecs);
    };

    if (needBpm) {
        TempoResult tempo = TempoEstimator::estimate(slice(*excerpt, place(tempoWin)),
                                                     excerpt->sampleRate);
        track.bpm = tempo.valid ? tempo.bpm : 0.0;
    }

    if (needKey) {
        KeyResult key = KeyEstimator::estimate(slice(*excerpt, place(keyWin)),
                                               excerpt->sampleRate);
        track.key = key.name();
    }

    EnergyResult energy = EnergyAnalyzer::analyze(slice(*excerpt, place(energyWin)));
    track.energy = energy.valid ? energy.energy : 0;
}
