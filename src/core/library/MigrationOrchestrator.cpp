#include "MigrationOrchestrator.h"
#include "MetadataResolver.h"
#include "../Settings.h"
#include "../convert/NmlToRekordboxConverter.h"
#include "../convert/RekordboxToNmlConverter.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include <algorithm>

std::optional<CueRetention> cueRetentionFromString(const QString& value)
{
    QString v = value.trimmed().toLower();
    if (v == "all")                       return CueRetention::All;
    if (v == "first8" || v == "first-8")  return CueRetention::First8;
    if (v == "none")                      return CueRetention::None;
    return std::nullopt;
}

std::optional<MissingFilePolicy> missingFilePolicyFromString(const QString& value)
{
    QString v = value.trimmed().toLower();
    if (v == "skip")                      return MissingFilePolicy::Skip;
    if (v == "include" || v == "warn")    return MissingFilePolicy::IncludeWithWarning;
    return std::nullopt;
}

MigrationOptions MigrationOptions::fromSettings(const Settings* settings)
{
    MigrationOptions o;
    if (!settings) return o;

    if (auto r = cueRetentionFromString(settings->cueRetention()))
        o.cueRetention = *r;
    else
        qWarning() << "[Migration] Unknown cue retention setting:" << settings->cueRetention();

    if (auto p = missingFilePolicyFromString(settings->missingFilePolicy()))
        o.missingFiles = *p;
    else
        qWarning() << "[Migration] Unknown missing-file setting:" << settings->missingFilePolicy();

    o.locateMissing = settings->locateMissingFiles();
    o.searchFolders = settings->libraryFolders();
    o.cueMapping.mapFirstHotCueToMemory = settings->mapFirstHotCueToMemory();
    o.cueMapping.mapMemoryToHotCue = settings->mapMemoryToHotCue();
    return o;
}

MigrationOrchestrator::MigrationOrchestrator(QObject* parent)
    : QObject(parent)
{
}

void MigrationOrchestrator::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    emit stateChanged(state);
}

void MigrationOrchestrator::applyCueRetention(Track& track, CueRetention retention)
{
    switch (retention) {
    case CueRetention::All:
        break;
    case CueRetention::First8:
        if (track.cuePoints.size() > kMaxRetainedCues)
            track.cuePoints.resize(kMaxRetainedCues);
        break;
    case CueRetention::None:
        track.cuePoints.clear();
        break;
    }
}

QHash<QString, QString> MigrationOrchestrator::buildLocateIndex(const QStringList& folders)
{
    QStringList nameFilters;
    for (const QString& ext : MetadataResolver::supportedExtensions())
        nameFilters << QStringLiteral("*.") + ext;

    QHash<QString, QString> index;
    for (const QString& folder : folders) {
        if (!QFileInfo(folder).isDir()) {
            qDebug() << "[Migration] Search folder not accessible:" << folder;
            continue;
        }
        QStringList files;
        QDirIterator it(folder, nameFilters, QDir::Files, QDirIterator::Subdirectories);
        while (it.hasNext())
            files.append(QFileInfo(it.next()).absoluteFilePath());
        std::sort(files.begin(), files.end());

        for (const QString& f : files) {
            const QString name = QFileInfo(f).fileName();
            if (!index.contains(name))
                index.insert(name, f);
        }
    }
    return index;
}

MigrationResult MigrationOrchestrator::cancel(MigrationResult& result, ProgressReporter& reporter)
{
    result.canceled = true;
    result.ok = false;
    setState(State::Canceled);
    reporter.report(reporter.lastPercent(), QStringLiteral("Migration canceled"));
    qDebug() << "[Migration] Canceled with" << result.tracks.size() << "tracks processed";
    return result;
}

MigrationResult MigrationOrchestrator::migrate(const QString& sourcePath, const QString& targetPath,
                                               LibraryFormat sourceFormat, LibraryFormat targetFormat,
                                               const MigrationOptions& options,
                                               CancellationToken* token,
                                               const ProgressCallback& progress)
{
    MigrationResult result;
    ProgressReporter reporter(progress);

    qDebug() << "[Migration]" << formatName(sourceFormat) << sourcePath << "->"
             << formatName(targetFormat) << targetPath;

    // ── Reading (0-30%) ─────────────────────────────────────────────
    setState(State::Reading);
    reporter.report(0, QStringLiteral("Reading %1").arg(QFileInfo(sourcePath).fileName()));

    if (!QFileInfo::exists(sourcePath)) {
        result.errorMessage = QStringLiteral("Source file does not exist: %1").arg(sourcePath);
        qWarning() << "[Migration]" << result.errorMessage;
        setState(State::Failed);
        return result;
    }

    ReadOptions readOptions;
    readOptions.skipMissingFiles = false;
    ImportResult source = LibraryCodec::read(sourceFormat, sourcePath, readOptions);
    result.skipped = source.skipped;
    if (!source.ok) {
        result.errorMessage = source.errorMessage;
        setState(State::Failed);
        return result;
    }

    const int total = source.document.tracks.size();
    reporter.report(30, QStringLiteral("Read %1 tracks").arg(total), 0, total);
    if (CancellationToken::canceled(token))
        return cancel(result, reporter);

    // ── Processing (30-70%) ─────────────────────────────────────────
    setState(State::Processing);
    QHash<QString, QString> locateIndex;
    bool locateIndexBuilt = false;

    for (int i = 0; i < total; ++i) {
        if (CancellationToken::canceled(token))
            return cancel(result, reporter);

        Track track = source.document.tracks[i];
        bool keep = true;

        // Missing-file resolution comes before cue trimming
        if (!QFileInfo::exists(track.filePath)) {
            if (options.locateMissing) {
                if (!locateIndexBuilt) {
                    locateIndex = buildLocateIndex(options.searchFolders);
                    locateIndexBuilt = true;
                }
                const QString found = locateIndex.value(QFileInfo(track.filePath).fileName());
                if (!found.isEmpty()) {
                    qDebug() << "[Migration] Located" << track.filePath << "at" << found;
                    track.filePath = found;
                    track.isCorrupt = false;
                    track.errorMessage.clear();
                    ++result.relocated;
                }
            }

            if (!QFileInfo::exists(track.filePath)) {
                if (options.missingFiles == MissingFilePolicy::Skip) {
                    qDebug() << "[Migration] Skipping missing file:" << track.filePath;
                    result.skipped.append({track.id.isEmpty() ? track.filePath : track.id,
                                           QStringLiteral("File does not exist: %1").arg(track.filePath)});
                    keep = false;
                } else {
                    qWarning() << "[Migration] Including missing file:" << track.filePath;
                    track.isCorrupt = true;
                    track.errorMessage = QStringLiteral("File does not exist");
                    ++result.missingIncluded;
                }
            }
        }

        if (keep) {
            applyCueRetention(track, options.cueRetention);
            result.tracks.append(track);
        }

        reporter.reportRange(30, 70, i + 1, total,
                             QStringLiteral("Processed %1").arg(track.title), i + 1, total);
    }

    LibraryDocument target;
    target.tracks = result.tracks;
    target.playlists = source.document.playlists;
    int dropped = LibraryCodec::pruneDanglingReferences(target);
    if (dropped > 0)
        qDebug() << "[Migration] Dropped" << dropped << "playlist references to skipped tracks";

    if (sourceFormat == LibraryFormat::Nml && targetFormat == LibraryFormat::RekordboxXml)
        NmlToRekordboxConverter::remapCues(target, options.cueMapping);
    else if (sourceFormat == LibraryFormat::RekordboxXml && targetFormat == LibraryFormat::Nml)
        RekordboxToNmlConverter::remapCues(target, options.cueMapping);
    result.tracks = target.tracks;

    if (CancellationToken::canceled(token))
        return cancel(result, reporter);

    // ── Writing (70-100%) ───────────────────────────────────────────
    setState(State::Writing);
    reporter.report(70, QStringLiteral("Writing %1").arg(QFileInfo(targetPath).fileName()),
                    result.tracks.size(), result.tracks.size());

    ExportResult written = LibraryCodec::write(targetFormat, targetPath, target);
    if (!written.ok) {
        result.errorMessage = written.errorMessage;
        setState(State::Failed);
        return result;
    }
    result.identities = written.identities;
    result.tracksWritten = written.tracksWritten;
    if (result.tracksWritten < result.tracks.size())
        qWarning() << "[Migration]" << result.tracks.size() - result.tracksWritten
                   << "tracks not written to" << targetPath;

    result.ok = true;
    setState(State::Done);
    reporter.report(100, QStringLiteral("Migration complete"),
                    result.tracks.size(), result.tracks.size());
    qDebug() << "[Migration] Done:" << result.tracksWritten << "tracks written,"
             << result.skipped.size() << "skipped," << result.relocated << "relocated,"
             << result.missingIncluded << "included missing";
    return result;
}
