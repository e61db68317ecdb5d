#include "M3uCodec.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QSaveFile>
#include <QSet>
#include <QTextStream>
#include <QUuid>

#include <cmath>

static const char* kLog = "[M3uCodec]";

QStringConverter::Encoding M3uCodec::encodingFor(const QString& filePath)
{
    return QFileInfo(filePath).suffix().toLower() == QLatin1String("m3u8")
        ? QStringConverter::Utf8 : QStringConverter::Latin1;
}

QString M3uCodec::entryPath(const QString& trackPath, const QString& playlistDir)
{
    const QString absolute = QDir::cleanPath(trackPath);
    const QString relative = QDir(playlistDir).relativeFilePath(absolute);
    if (QDir::isAbsolutePath(relative))
        return absolute;    // other drive

    int parents = 0;
    const QStringList parts = relative.split(QLatin1Char('/'));
    for (const QString& part : parts) {
        if (part != QLatin1String(".."))
            break;
        ++parents;
    }
    return parents > kMaxParentTraversal ? absolute : relative;
}

// ── importM3U ───────────────────────────────────────────────────────
ImportResult M3uCodec::read(const QString& filePath, const ReadOptions& options)
{
    ImportResult result;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        result.errorMessage = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }

    QDir baseDir = QFileInfo(filePath).absoluteDir();
    QTextStream in(&file);
    in.setEncoding(encodingFor(filePath));

    Playlist playlist;
    playlist.name = QFileInfo(filePath).completeBaseName();

    QHash<QString, QString> idByPath;
    QString pendingTitle, pendingArtist;
    double pendingDuration = 0.0;
    int lineNo = 0;

    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();
        ++lineNo;
        if (lineNo == 1 && line.startsWith(QChar(0xFEFF)))
            line.remove(0, 1);
        if (line.isEmpty())
            continue;

        if (line.startsWith(QLatin1String("#PLAYLIST:"))) {
            QString name = line.mid(10).trimmed();
            if (!name.isEmpty()) playlist.name = name;
            continue;
        }
        if (line.startsWith(QLatin1String("#EXTINF:"))) {
            // #EXTINF:<seconds>,<artist> - <title>
            QString info = line.mid(8);
            int comma = info.indexOf(QLatin1Char(','));
            pendingDuration = info.left(comma).trimmed().toDouble();
            QString display = comma >= 0 ? info.mid(comma + 1).trimmed() : QString();
            int dash = display.indexOf(QLatin1String(" - "));
            if (dash > 0) {
                pendingArtist = display.left(dash).trimmed();
                pendingTitle = display.mid(dash + 3).trimmed();
            } else {
                pendingArtist.clear();
                pendingTitle = display;
            }
            continue;
        }
        if (line.startsWith(QLatin1Char('#')))
            continue;

        // Resolve relative paths against the m3u file's directory
        QString path = QDir::fromNativeSeparators(line);
        if (!QDir::isAbsolutePath(path))
            path = baseDir.absoluteFilePath(path);
        path = QDir::cleanPath(path);

        QString title = pendingTitle, artist = pendingArtist;
        double duration = pendingDuration;
        pendingTitle.clear();
        pendingArtist.clear();
        pendingDuration = 0.0;

        // Same file listed twice: one track, two playlist slots
        auto existing = idByPath.constFind(path);
        if (existing != idByPath.constEnd()) {
            playlist.trackIds.append(existing.value());
            continue;
        }

        Track t;
        t.id       = QUuid::createUuid().toString(QUuid::WithoutBraces);
        t.filePath = path;
        t.title    = title;
        t.artist   = artist;
        t.duration = duration > 0.0 ? duration : 0.0;

        const QString entry = QStringLiteral("line %1").arg(lineNo);
        if (!LibraryCodec::admitReferencedFile(t, options, entry, result.skipped, kLog))
            continue;

        t.applyDefaults();
        idByPath.insert(path, t.id);
        result.document.tracks.append(t);
        playlist.trackIds.append(t.id);
    }

    result.document.playlists.append(playlist);
    result.ok = true;
    qDebug() << kLog << "Imported" << playlist.name << "- tracks:"
             << result.document.tracks.size() << "skipped:" << result.skipped.size();
    return result;
}

// ── exportM3U ───────────────────────────────────────────────────────
ExportResult M3uCodec::write(const QString& filePath, const LibraryDocument& document)
{
    ExportResult result;

    // One playlist per file: the first one, followed by every collection
    // track it does not reference, in document order
    Playlist playlist;
    if (!document.playlists.isEmpty()) {
        playlist = document.playlists.front();
        if (document.playlists.size() > 1)
            qDebug() << kLog << "M3U holds one playlist; writing" << playlist.name
                     << "and flattening" << document.playlists.size() - 1 << "more";

        const QSet<QString> listed(playlist.trackIds.cbegin(), playlist.trackIds.cend());
        int appended = 0;
        for (const Track& t : document.tracks) {
            if (!listed.contains(t.id)) {
                playlist.trackIds.append(t.id);
                ++appended;
            }
        }
        if (appended > 0)
            qWarning() << kLog << appended << "tracks outside playlist" << playlist.name
                       << "appended after it";
    } else {
        playlist.name = QFileInfo(filePath).completeBaseName();
        for (const Track& t : document.tracks)
            playlist.trackIds.append(t.id);
    }

    QSaveFile file(filePath);
    if (!LibraryCodec::openForWriting(file, result, kLog))
        return result;

    const QString playlistDir = QFileInfo(filePath).absolutePath();
    const QStringConverter::Encoding encoding = encodingFor(filePath);

    QTextStream out(&file);
    out.setEncoding(encoding);
    out << QStringLiteral("#EXTM3U\n");
    out << QStringLiteral("#PLAYLIST:") << playlist.name << QStringLiteral("\n");

    QHash<QString, int> indexById;
    for (int i = 0; i < document.tracks.size(); ++i)
        indexById.insert(document.tracks[i].id, i);

    for (const QString& id : playlist.trackIds) {
        int idx = indexById.value(id, -1);
        if (id.isEmpty() || idx < 0 || document.tracks[idx].filePath.isEmpty()) {
            ++result.droppedReferences;
            continue;
        }
        const Track& track = document.tracks[idx];

        if (encoding == QStringConverter::Latin1) {
            const QString text = track.artist + track.title + track.filePath;
            for (const QChar c : text) {
                if (c.unicode() > 0xFF) {
                    qWarning() << kLog << "Characters outside Latin-1 in" << track.filePath
                               << "- use .m3u8 to keep them";
                    break;
                }
            }
        }

        // Artist always present so the reader splits on the first " - "
        const QString artist = track.artist.isEmpty() ? unknownArtist() : track.artist;
        out << QStringLiteral("#EXTINF:") << std::lround(track.duration)
            << QStringLiteral(",") << artist << QStringLiteral(" - ") << track.title
            << QStringLiteral("\n");
        out << QDir::toNativeSeparators(entryPath(track.filePath, playlistDir))
            << QStringLiteral("\n");

        // Path is the only identity a playlist line has
        if (!result.identities.contains(id)) {
            result.identities.insert(id, track.filePath);
            ++result.tracksWritten;
        }
    }
    out.flush();

    if (out.status() != QTextStream::Ok) {
        file.cancelWriting();
        result.errorMessage = QStringLiteral("Failed to write %1: %2").arg(filePath, file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }
    if (!LibraryCodec::commit(file, result, kLog))
        return result;

    result.playlistsWritten = 1;
    qDebug() << kLog << "Exported M3U:" << filePath << "tracks:" << result.tracksWritten;
    return result;
}
