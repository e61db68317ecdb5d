#include "RekordboxXmlCodec.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QSet>
#include <QUrl>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <cmath>

static const char* kLog = "[RekordboxXml]";
static const QString kLocalhostPrefix = QStringLiteral("file://localhost");

// ── Cue type codes ──────────────────────────────────────────────────
std::optional<CueType> RekordboxXmlCodec::cueTypeFromCode(int code)
{
    switch (code) {
    case 0: return CueType::HotCue;
    case 1: return CueType::Loop;
    case 2: return CueType::Memory;
    case 4: return CueType::Grid;
    default: return std::nullopt;
    }
}

int RekordboxXmlCodec::codeForCueType(CueType type)
{
    switch (type) {
    case CueType::HotCue: return 0;
    case CueType::Loop:   return 1;
    case CueType::Memory: return 2;
    case CueType::Grid:
    case CueType::Beat:   return 4;   // no separate beat marker
    }
    return 0;
}

// ── Location ────────────────────────────────────────────────────────
QString RekordboxXmlCodec::locationFromPath(const QString& filePath)
{
    QString path = QDir::fromNativeSeparators(filePath);
    if (!path.startsWith(QLatin1Char('/')))
        path.prepend(QLatin1Char('/'));   // "C:/x" -> "/C:/x"
    return kLocalhostPrefix
         + QString::fromUtf8(QUrl::toPercentEncoding(path, QByteArrayLiteral("/:")));
}

QString RekordboxXmlCodec::pathFromLocation(const QString& location)
{
    QString rest;
    if (location.startsWith(kLocalhostPrefix, Qt::CaseInsensitive)) {
        rest = location.mid(kLocalhostPrefix.size());
    } else if (location.startsWith(QLatin1String("file://"), Qt::CaseInsensitive)) {
        rest = location.mid(7);
    } else {
        return QDir::cleanPath(QDir::fromNativeSeparators(location));
    }

    QString path = QUrl::fromPercentEncoding(rest.toUtf8());
    path = QDir::fromNativeSeparators(path);

    static const QRegularExpression drive(QStringLiteral("^/[A-Za-z]:/"));
    if (drive.match(path).hasMatch())
        path = path.mid(1);
    else if (!path.startsWith(QLatin1Char('/')))
        path.prepend(QLatin1Char('/'));
    return QDir::cleanPath(path);
}

QString RekordboxXmlCodec::kindForPath(const QString& filePath)
{
    QString ext = QFileInfo(filePath).suffix().toLower();
    if (ext == "mp3")  return QStringLiteral("MP3 File");
    if (ext == "flac") return QStringLiteral("FLAC File");
    if (ext == "wav")  return QStringLiteral("WAV File");
    if (ext == "m4a")  return QStringLiteral("M4A File");
    if (ext == "aac")  return QStringLiteral("AAC File");
    return ext.toUpper() + QStringLiteral(" File");
}

// ═════════════════════════════════════════════════════════════════════
//  Reading
// ═════════════════════════════════════════════════════════════════════

static void readTrackChildren(QXmlStreamReader& xml, Track& t)
{
    int hotCueOrdinal = 0;
    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("POSITION_MARK")) {
            xml.skipCurrentElement();
            continue;
        }

        const QXmlStreamAttributes a = xml.attributes();
        bool ok = false;
        int code = a.value(QLatin1String("Type")).toInt(&ok);
        std::optional<CueType> type = ok ? RekordboxXmlCodec::cueTypeFromCode(code) : std::nullopt;
        if (!type) {
            qDebug() << kLog << "Ignoring POSITION_MARK with Type"
                     << a.value(QLatin1String("Type")).toString() << "in" << t.id;
            xml.skipCurrentElement();
            continue;
        }

        CueMarker cue;
        cue.type = *type;
        cue.startSecs = a.value(QLatin1String("Start")).toDouble();
        cue.label = a.value(QLatin1String("Name")).toString();
        if (cue.type == CueType::HotCue) {
            bool numOk = false;
            int num = a.value(QLatin1String("Num")).toInt(&numOk);
            cue.hotCueIndex = (numOk && num >= 0) ? num : hotCueOrdinal;
            ++hotCueOrdinal;
        }
        t.cuePoints.append(cue);
        xml.skipCurrentElement();
    }
}

void RekordboxXmlCodec::readCollection(QXmlStreamReader& xml, const ReadOptions& options,
                                       ImportResult& result)
{
    QSet<QString> seen;
    int index = 0;

    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("TRACK")) {
            xml.skipCurrentElement();
            continue;
        }
        ++index;

        const QXmlStreamAttributes a = xml.attributes();
        Track t;
        t.id       = a.value(QLatin1String("TrackID")).toString().trimmed();
        t.title    = a.value(QLatin1String("Name")).toString();
        t.artist   = a.value(QLatin1String("Artist")).toString();
        t.album    = a.value(QLatin1String("Album")).toString();
        t.genre    = a.value(QLatin1String("Genre")).toString();
        t.year     = a.value(QLatin1String("Year")).toString();
        t.comment  = a.value(QLatin1String("Comments")).toString();
        t.duration = a.value(QLatin1String("TotalTime")).toDouble();
        t.bpm      = a.value(QLatin1String("AverageBpm")).toDouble();
        QString tonality = a.value(QLatin1String("Tonality")).toString().trimmed();
        if (!tonality.isEmpty())
            t.key = tonality;
        QString location = a.value(QLatin1String("Location")).toString();

        readTrackChildren(xml, t);

        const QString entryName = t.id.isEmpty()
            ? QStringLiteral("TRACK #%1").arg(index) : QStringLiteral("TrackID %1").arg(t.id);

        QString reason;
        if (t.id.isEmpty())
            reason = QStringLiteral("Missing TrackID");
        else if (seen.contains(t.id))
            reason = QStringLiteral("Duplicate TrackID");
        else if (location.isEmpty())
            reason = QStringLiteral("Missing Location");

        if (!t.id.isEmpty())
            seen.insert(t.id);

        if (!reason.isEmpty()) {
            qDebug() << kLog << "Skipping" << entryName << "-" << reason;
            result.skipped.append({entryName, reason});
            continue;
        }

        t.filePath = pathFromLocation(location);
        if (!LibraryCodec::admitReferencedFile(t, options, entryName, result.skipped, kLog))
            continue;

        t.applyDefaults();
        result.document.tracks.append(t);
    }
}

void RekordboxXmlCodec::readPlaylistNode(QXmlStreamReader& xml, ImportResult& result,
                                         const QHash<QString, QString>& idByLocation)
{
    const QXmlStreamAttributes a = xml.attributes();
    const QString type = a.value(QLatin1String("Type")).toString();

    if (type == QLatin1String("1")) {
        Playlist p;
        p.name = a.value(QLatin1String("Name")).toString();
        const bool byLocation = a.value(QLatin1String("KeyType")) == QLatin1String("1");
        while (xml.readNextStartElement()) {
            if (xml.name() == QLatin1String("TRACK")) {
                const QXmlStreamAttributes ta = xml.attributes();
                // Some exporters reference the track by TrackID instead of Key
                QString key = ta.hasAttribute(QLatin1String("Key"))
                    ? ta.value(QLatin1String("Key")).toString()
                    : ta.value(QLatin1String("TrackID")).toString();
                if (byLocation)
                    key = idByLocation.value(pathFromLocation(key));
                if (!key.isEmpty())
                    p.trackIds.append(key);
            }
            xml.skipCurrentElement();
        }
        result.document.playlists.append(p);
        return;
    }

    // Type 0: folder (ROOT included)
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("NODE"))
            readPlaylistNode(xml, result, idByLocation);
        else
            xml.skipCurrentElement();
    }
}

ImportResult RekordboxXmlCodec::read(const QString& filePath, const ReadOptions& options)
{
    ImportResult result;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.errorMessage = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }

    QXmlStreamReader xml(&file);
    if (!xml.readNextStartElement() || xml.name() != QLatin1String("DJ_PLAYLISTS")) {
        result.errorMessage = xml.hasError()
            ? QStringLiteral("rekordbox XML parse error: %1").arg(xml.errorString())
            : QStringLiteral("Not a rekordbox XML document: %1").arg(filePath);
        qWarning() << kLog << result.errorMessage;
        return result;
    }

    QHash<QString, QString> idByLocation;
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("COLLECTION")) {
            readCollection(xml, options, result);
            for (const Track& t : result.document.tracks)
                idByLocation.insert(t.filePath, t.id);
        } else if (xml.name() == QLatin1String("PLAYLISTS")) {
            while (xml.readNextStartElement()) {
                if (xml.name() == QLatin1String("NODE"))
                    readPlaylistNode(xml, result, idByLocation);
                else
                    xml.skipCurrentElement();
            }
        } else {
            xml.skipCurrentElement();
        }
    }

    if (xml.hasError()) {
        result.errorMessage = QStringLiteral("rekordbox XML parse error at line %1: %2")
                                  .arg(xml.lineNumber()).arg(xml.errorString());
        qWarning() << kLog << result.errorMessage;
        result.document = LibraryDocument();
        return result;
    }

    int dangling = LibraryCodec::pruneDanglingReferences(result.document);
    if (dangling > 0)
        qDebug() << kLog << "Dropped" << dangling << "playlist references to skipped tracks";

    result.ok = true;
    qDebug() << kLog << "Read" << result.document.tracks.size() << "tracks,"
             << result.document.playlists.size() << "playlists, skipped"
             << result.skipped.size() << "from" << filePath;
    return result;
}

// ═════════════════════════════════════════════════════════════════════
//  Writing
// ═════════════════════════════════════════════════════════════════════

static void writeTrack(QXmlStreamWriter& xml, const Track& t, const QString& trackId)
{
    xml.writeStartElement(QStringLiteral("TRACK"));
    xml.writeAttribute(QStringLiteral("TrackID"), trackId);
    xml.writeAttribute(QStringLiteral("Name"), t.title);
    xml.writeAttribute(QStringLiteral("Artist"), t.artist);
    xml.writeAttribute(QStringLiteral("Album"), t.album);
    xml.writeAttribute(QStringLiteral("Genre"), t.genre);
    xml.writeAttribute(QStringLiteral("Kind"), RekordboxXmlCodec::kindForPath(t.filePath));
    xml.writeAttribute(QStringLiteral("Size"), QString::number(QFileInfo(t.filePath).size()));
    xml.writeAttribute(QStringLiteral("TotalTime"), QString::number(std::lround(t.duration)));
    xml.writeAttribute(QStringLiteral("Year"), t.year);
    xml.writeAttribute(QStringLiteral("AverageBpm"), LibraryCodec::numberString(t.bpm, 2));
    xml.writeAttribute(QStringLiteral("Tonality"), t.key);
    xml.writeAttribute(QStringLiteral("Comments"), t.comment);
    xml.writeAttribute(QStringLiteral("Location"), RekordboxXmlCodec::locationFromPath(t.filePath));

    if (t.bpm > 0.0) {
        xml.writeEmptyElement(QStringLiteral("TEMPO"));
        xml.writeAttribute(QStringLiteral("Inizio"), QStringLiteral("0.000"));
        xml.writeAttribute(QStringLiteral("Bpm"), LibraryCodec::numberString(t.bpm, 2));
        xml.writeAttribute(QStringLiteral("Metro"), QStringLiteral("4/4"));
        xml.writeAttribute(QStringLiteral("Battito"), QStringLiteral("1"));
    }

    for (const CueMarker& cue : t.cuePoints) {
        xml.writeEmptyElement(QStringLiteral("POSITION_MARK"));
        xml.writeAttribute(QStringLiteral("Name"), cue.label);
        xml.writeAttribute(QStringLiteral("Type"),
                           QString::number(RekordboxXmlCodec::codeForCueType(cue.type)));
        xml.writeAttribute(QStringLiteral("Start"), LibraryCodec::numberString(cue.startSecs, 3));
        xml.writeAttribute(QStringLiteral("Num"),
                           QString::number(cue.type == CueType::HotCue ? cue.hotCueIndex : -1));
    }

    xml.writeEndElement(); // TRACK
}

ExportResult RekordboxXmlCodec::write(const QString& filePath, const LibraryDocument& document)
{
    ExportResult result;

    QSaveFile file(filePath);
    if (!LibraryCodec::openForWriting(file, result, kLog))
        return result;

    // Sequential ids, reset per export
    for (int i = 0; i < document.tracks.size(); ++i) {
        if (!document.tracks[i].id.isEmpty())
            result.identities.insert(document.tracks[i].id, QString::number(i + 1));
    }

    QXmlStreamWriter xml(&file);
    xml.setAutoFormatting(true);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("DJ_PLAYLISTS"));
    xml.writeAttribute(QStringLiteral("Version"), QStringLiteral("1.0.0"));

    xml.writeEmptyElement(QStringLiteral("PRODUCT"));
    xml.writeAttribute(QStringLiteral("Name"), QStringLiteral("CrateBridge"));
    QString version = QCoreApplication::applicationVersion();
    xml.writeAttribute(QStringLiteral("Version"),
                       version.isEmpty() ? QStringLiteral("1.0.0") : version);
    xml.writeAttribute(QStringLiteral("Company"), QStringLiteral("CrateBridge"));

    xml.writeStartElement(QStringLiteral("COLLECTION"));
    xml.writeAttribute(QStringLiteral("Entries"), QString::number(document.tracks.size()));
    for (int i = 0; i < document.tracks.size(); ++i)
        writeTrack(xml, document.tracks[i], QString::number(i + 1));
    xml.writeEndElement(); // COLLECTION
    result.tracksWritten = document.tracks.size();

    xml.writeStartElement(QStringLiteral("PLAYLISTS"));
    xml.writeStartElement(QStringLiteral("NODE"));
    xml.writeAttribute(QStringLiteral("Type"), QStringLiteral("0"));
    xml.writeAttribute(QStringLiteral("Name"), QStringLiteral("ROOT"));
    xml.writeAttribute(QStringLiteral("Count"), QString::number(document.playlists.size()));
    for (const Playlist& p : document.playlists) {
        QStringList refs = LibraryCodec::mapReferences(p.trackIds, result.identities,
                                                       result.droppedReferences);
        xml.writeStartElement(QStringLiteral("NODE"));
        xml.writeAttribute(QStringLiteral("Name"), p.name);
        xml.writeAttribute(QStringLiteral("Type"), QStringLiteral("1"));
        xml.writeAttribute(QStringLiteral("KeyType"), QStringLiteral("0"));
        xml.writeAttribute(QStringLiteral("Entries"), QString::number(refs.size()));
        for (const QString& ref : refs) {
            xml.writeEmptyElement(QStringLiteral("TRACK"));
            xml.writeAttribute(QStringLiteral("Key"), ref);
        }
        xml.writeEndElement(); // NODE
        ++result.playlistsWritten;
    }
    xml.writeEndElement(); // NODE ROOT
    xml.writeEndElement(); // PLAYLISTS

    xml.writeEndElement(); // DJ_PLAYLISTS
    xml.writeEndDocument();

    if (xml.hasError()) {
        file.cancelWriting();
        result.errorMessage = QStringLiteral("Failed to serialise rekordbox XML: %1")
                                  .arg(file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }
    if (!LibraryCodec::commit(file, result, kLog))
        return result;

    if (result.droppedReferences > 0)
        qDebug() << kLog << "Dropped" << result.droppedReferences << "unmapped playlist references";
    qDebug() << kLog << "Wrote" << result.tracksWritten << "tracks,"
             << result.playlistsWritten << "playlists to" << filePath;
    return result;
}
