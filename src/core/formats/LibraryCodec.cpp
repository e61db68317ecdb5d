#include "LibraryCodec.h"
#include "CsvCodec.h"
#include "M3uCodec.h"
#include "NmlCodec.h"
#include "RekordboxXmlCodec.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QSet>

ImportResult LibraryCodec::read(LibraryFormat format, const QString& filePath,
                                const ReadOptions& options)
{
    switch (format) {
    case LibraryFormat::Nml:          return NmlCodec::read(filePath, options);
    case LibraryFormat::RekordboxXml: return RekordboxXmlCodec::read(filePath, options);
    case LibraryFormat::Csv:          return CsvCodec::read(filePath, options);
    case LibraryFormat::M3u:          return M3uCodec::read(filePath, options);
    }
    ImportResult result;
    result.errorMessage = QStringLiteral("Unsupported format");
    return result;
}

ExportResult LibraryCodec::write(LibraryFormat format, const QString& filePath,
                                 const LibraryDocument& document)
{
    switch (format) {
    case LibraryFormat::Nml:          return NmlCodec::write(filePath, document);
    case LibraryFormat::RekordboxXml: return RekordboxXmlCodec::write(filePath, document);
    case LibraryFormat::Csv:          return CsvCodec::write(filePath, document);
    case LibraryFormat::M3u:          return M3uCodec::write(filePath, document);
    }
    ExportResult result;
    result.errorMessage = QStringLiteral("Unsupported format");
    return result;
}

bool LibraryCodec::admitReferencedFile(Track& track, const ReadOptions& options,
                                       const QString& entry, QVector<SkipRecord>& skipped,
                                       const char* component)
{
    if (QFileInfo::exists(track.filePath))
        return true;

    if (options.skipMissingFiles) {
        qDebug() << component << "Skipping" << entry << "- file does not exist:" << track.filePath;
        skipped.append({entry, QStringLiteral("File does not exist: %1").arg(track.filePath)});
        return false;
    }

    track.isCorrupt = true;
    track.errorMessage = QStringLiteral("File does not exist");
    return true;
}

int LibraryCodec::pruneDanglingReferences(LibraryDocument& document)
{
    QSet<QString> ids;
    for (const Track& t : document.tracks)
        ids.insert(t.id);

    int removed = 0;
    for (Playlist& p : document.playlists) {
        QStringList kept;
        for (const QString& id : p.trackIds) {
            if (ids.contains(id))
                kept.append(id);
            else
                ++removed;
        }
        p.trackIds = kept;
    }
    return removed;
}

QStringList LibraryCodec::mapReferences(const QStringList& trackIds,
                                        const IdentityMap& identities, int& dropped)
{
    QStringList mapped;
    for (const QString& id : trackIds) {
        auto it = identities.constFind(id);
        if (it == identities.constEnd()) {
            ++dropped;
            continue;
        }
        mapped.append(it.value());
    }
    return mapped;
}

bool LibraryCodec::openForWriting(QSaveFile& file, ExportResult& result,
                                  const char* component)
{
    QFileInfo target(file.fileName());
    if (!target.absoluteDir().exists()) {
        result.errorMessage = QStringLiteral("Target directory does not exist: %1")
                                  .arg(target.absolutePath());
        qWarning() << component << result.errorMessage;
        return false;
    }
    if (!file.open(QIODevice::WriteOnly)) {
        result.errorMessage = QStringLiteral("Cannot open %1 for writing: %2")
                                  .arg(file.fileName(), file.errorString());
        qWarning() << component << result.errorMessage;
        return false;
    }
    return true;
}

bool LibraryCodec::commit(QSaveFile& file, ExportResult& result, const char* component)
{
    if (!file.commit()) {
        result.ok = false;
        result.errorMessage = QStringLiteral("Failed to write %1: %2")
                                  .arg(file.fileName(), file.errorString());
        qWarning() << component << result.errorMessage;
        return false;
    }
    result.ok = true;
    return true;
}

QString LibraryCodec::numberString(double value, int decimals)
{
    return QString::number(value, 'f', decimals);
}
