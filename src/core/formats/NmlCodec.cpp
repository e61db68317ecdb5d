#include "NmlCodec.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QSet>
#include <QUuid>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <cmath>

static const char* kLog = "[NmlCodec]";

// ── Cue type codes ──────────────────────────────────────────────────
std::optional<CueType> NmlCodec::cueTypeFromCode(int code)
{
    switch (code) {
    case 0: return CueType::HotCue;
    case 1: return CueType::Loop;
    case 4: return CueType::Grid;
    case 9: return CueType::Beat;
    default: return std::nullopt;
    }
}

std::optional<int> NmlCodec::codeForCueType(CueType type)
{
    switch (type) {
    case CueType::HotCue: return 0;
    case CueType::Loop:   return 1;
    case CueType::Grid:   return 4;
    case CueType::Beat:   return 9;
    case CueType::Memory: return std::nullopt;
    }
    return std::nullopt;
}

// ── LOCATION ────────────────────────────────────────────────────────
QString NmlCodec::joinLocation(const QString& volume, const QString& dir, const QString& file)
{
    if (file.isEmpty())
        return QString();

    // Legacy documents put the full path into FILE
    if (!dir.contains(QLatin1String("/:"))) {
        if (QDir::isAbsolutePath(file) || dir.isEmpty())
            return QDir::cleanPath(file);
        return QDir::cleanPath(dir + QLatin1Char('/') + file);
    }

    QString path = dir;
    path.replace(QLatin1String("/:"), QLatin1String("/"));
    if (!path.endsWith(QLatin1Char('/')))
        path += QLatin1Char('/');
    path += file;

    // "C:" volumes are drive letters; other volume names are mount labels
    if (volume.size() == 2 && volume.at(1) == QLatin1Char(':'))
        path = volume + path;
    return QDir::cleanPath(path);
}

void NmlCodec::splitLocation(const QString& filePath, QString& volume, QString& dir, QString& file)
{
    QString path = QDir::fromNativeSeparators(filePath);
    volume.clear();
    if (path.size() >= 2 && path.at(1) == QLatin1Char(':')) {
        volume = path.left(2);
        path = path.mid(2);
    }

    int slash = path.lastIndexOf(QLatin1Char('/'));
    file = path.mid(slash + 1);
    QString parent = slash > 0 ? path.left(slash) : QString();

    dir = QStringLiteral("/:");
    const QStringList parts = parent.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString& part : parts)
        dir += part + QStringLiteral("/:");
}

// ═════════════════════════════════════════════════════════════════════
//  Reading
// ═════════════════════════════════════════════════════════════════════

struct NmlEntry {
    QString id;
    QString title;
    QString artist;
    QString volume, dir, file;
    bool    hasLocation = false;
    Track   track;
};

static void readEntryChildren(QXmlStreamReader& xml, NmlEntry& e)
{
    int hotCueOrdinal = 0;
    while (xml.readNextStartElement()) {
        const auto name = xml.name();
        const QXmlStreamAttributes a = xml.attributes();

        if (name == QLatin1String("TITLE")) {
            QString text = xml.readElementText().trimmed();
            if (!text.isEmpty()) e.title = text;
        } else if (name == QLatin1String("ARTIST")) {
            QString text = xml.readElementText().trimmed();
            if (!text.isEmpty()) e.artist = text;
        } else if (name == QLatin1String("LOCATION")) {
            e.volume = a.value(QLatin1String("VOLUME")).toString();
            e.dir    = a.value(QLatin1String("DIR")).toString();
            e.file   = a.value(QLatin1String("FILE")).toString();
            e.hasLocation = !e.file.isEmpty();
            xml.skipCurrentElement();
        } else if (name == QLatin1String("ALBUM")) {
            e.track.album = a.value(QLatin1String("TITLE")).toString();
            xml.skipCurrentElement();
        } else if (name == QLatin1String("INFO")) {
            e.track.genre   = a.value(QLatin1String("GENRE")).toString();
            e.track.comment = a.value(QLatin1String("COMMENT")).toString();
            e.track.year    = a.value(QLatin1String("RELEASE_DATE")).toString().left(4);
            e.track.duration = a.value(QLatin1String("PLAYTIME")).toDouble();
            xml.skipCurrentElement();
        } else if (name == QLatin1String("TEMPO")) {
            e.track.bpm = a.value(QLatin1String("BPM")).toDouble();
            xml.skipCurrentElement();
        } else if (name == QLatin1String("KEY")) {
            QString value = a.value(QLatin1String("VALUE")).toString().trimmed();
            if (!value.isEmpty()) e.track.key = value;
            xml.skipCurrentElement();
        } else if (name == QLatin1String("MUSICAL_KEY")) {
            // Only used when no KEY VALUE string is present
            bool ok = false;
            int value = a.value(QLatin1String("VALUE")).toInt(&ok);
            if (ok && value >= 0 && e.track.key == QLatin1String("Unknown"))
                e.track.key = kPitchClassNames.at(value % 12);
            xml.skipCurrentElement();
        } else if (name == QLatin1String("CUE_V2")) {
            bool ok = false;
            int code = a.value(QLatin1String("TYPE")).toInt(&ok);
            std::optional<CueType> type = ok ? NmlCodec::cueTypeFromCode(code) : std::nullopt;
            if (!type) {
                qDebug() << kLog << "Ignoring CUE_V2 with TYPE"
                         << a.value(QLatin1String("TYPE")).toString() << "in entry" << e.id;
            } else {
                CueMarker cue;
                cue.type = *type;
                cue.startSecs = a.value(QLatin1String("START")).toDouble() / 1000.0;
                cue.label = a.value(QLatin1String("NAME")).toString();
                if (cue.type == CueType::HotCue) {
                    bool slotOk = false;
                    int slot = a.value(QLatin1String("HOTCUE")).toInt(&slotOk);
                    cue.hotCueIndex = (slotOk && slot >= 0) ? slot : hotCueOrdinal;
                    ++hotCueOrdinal;
                }
                e.track.cuePoints.append(cue);
            }
            xml.skipCurrentElement();
        } else {
            xml.skipCurrentElement();
        }
    }
}

void NmlCodec::readCollection(QXmlStreamReader& xml, const ReadOptions& options,
                              ImportResult& result)
{
    QSet<QString> seen;
    int index = 0;

    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("ENTRY")) {
            xml.skipCurrentElement();
            continue;
        }
        ++index;

        NmlEntry e;
        const QXmlStreamAttributes a = xml.attributes();
        e.id     = a.value(QLatin1String("ID")).toString().trimmed();
        e.title  = a.value(QLatin1String("TITLE")).toString().trimmed();
        e.artist = a.value(QLatin1String("ARTIST")).toString().trimmed();
        readEntryChildren(xml, e);

        const QString entryName = e.id.isEmpty()
            ? QStringLiteral("ENTRY #%1").arg(index) : e.id;

        QString reason;
        if (e.id.isEmpty())
            reason = QStringLiteral("Missing ID");
        else if (seen.contains(e.id))
            reason = QStringLiteral("Duplicate ID");
        else if (e.title.isEmpty() || e.artist.isEmpty())
            reason = QStringLiteral("Missing TITLE or ARTIST");
        else if (!e.hasLocation)
            reason = QStringLiteral("Missing LOCATION");

        // An ID is taken by its first entry, admitted or not
        if (!e.id.isEmpty())
            seen.insert(e.id);

        if (!reason.isEmpty()) {
            qDebug() << kLog << "Skipping" << entryName << "-" << reason;
            result.skipped.append({entryName, reason});
            continue;
        }

        Track& t = e.track;
        t.id       = e.id;
        t.title    = e.title;
        t.artist   = e.artist;
        t.filePath = joinLocation(e.volume, e.dir, e.file);
        if (!LibraryCodec::admitReferencedFile(t, options, entryName, result.skipped, kLog))
            continue;

        t.applyDefaults();
        result.document.tracks.append(t);
    }
}

void NmlCodec::readPlaylistNode(QXmlStreamReader& xml, ImportResult& result)
{
    const QString type = xml.attributes().value(QLatin1String("TYPE")).toString();
    const QString name = xml.attributes().value(QLatin1String("NAME")).toString();

    if (type == QLatin1String("PLAYLIST")) {
        Playlist p;
        p.name = name;
        while (xml.readNextStartElement()) {
            if (xml.name() == QLatin1String("NODE")
                && xml.attributes().value(QLatin1String("TYPE")) == QLatin1String("TRACK")) {
                QString key = xml.attributes().value(QLatin1String("KEY")).toString();
                if (!key.isEmpty())
                    p.trackIds.append(key);
            }
            xml.skipCurrentElement();
        }
        result.document.playlists.append(p);
        return;
    }

    // FOLDER nodes: flatten their playlists
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("NODE"))
            readPlaylistNode(xml, result);
        else
            xml.skipCurrentElement();
    }
}

void NmlCodec::readSets(QXmlStreamReader& xml, ImportResult& result)
{
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("NODE"))
            readPlaylistNode(xml, result);
        else
            xml.skipCurrentElement();
    }
}

ImportResult NmlCodec::read(const QString& filePath, const ReadOptions& options)
{
    ImportResult result;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.errorMessage = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }

    QXmlStreamReader xml(&file);
    if (!xml.readNextStartElement() || xml.name() != QLatin1String("NML")) {
        result.errorMessage = xml.hasError()
            ? QStringLiteral("NML parse error: %1").arg(xml.errorString())
            : QStringLiteral("Not a Traktor NML document: %1").arg(filePath);
        qWarning() << kLog << result.errorMessage;
        return result;
    }

    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("COLLECTION"))
            readCollection(xml, options, result);
        else if (xml.name() == QLatin1String("SETS"))
            readSets(xml, result);
        else
            xml.skipCurrentElement();
    }

    if (xml.hasError()) {
        result.errorMessage = QStringLiteral("NML parse error at line %1: %2")
                                  .arg(xml.lineNumber()).arg(xml.errorString());
        qWarning() << kLog << result.errorMessage;
        result.document = LibraryDocument();
        return result;
    }

    int dangling = LibraryCodec::pruneDanglingReferences(result.document);
    if (dangling > 0)
        qDebug() << kLog << "Dropped" << dangling << "playlist references to skipped entries";

    result.ok = true;
    qDebug() << kLog << "Read" << result.document.tracks.size() << "entries,"
             << result.document.playlists.size() << "playlists, skipped"
             << result.skipped.size() << "from" << filePath;
    return result;
}

// ═════════════════════════════════════════════════════════════════════
//  Writing
// ═════════════════════════════════════════════════════════════════════

static void writeEntry(QXmlStreamWriter& xml, const Track& t, const QString& id)
{
    xml.writeStartElement(QStringLiteral("ENTRY"));
    xml.writeAttribute(QStringLiteral("ID"), id);
    xml.writeAttribute(QStringLiteral("TITLE"), t.title);
    xml.writeAttribute(QStringLiteral("ARTIST"), t.artist);

    xml.writeTextElement(QStringLiteral("TITLE"), t.title);
    xml.writeTextElement(QStringLiteral("ARTIST"), t.artist);

    QString volume, dir, file;
    NmlCodec::splitLocation(t.filePath, volume, dir, file);
    xml.writeEmptyElement(QStringLiteral("LOCATION"));
    xml.writeAttribute(QStringLiteral("DIR"), dir);
    xml.writeAttribute(QStringLiteral("FILE"), file);
    xml.writeAttribute(QStringLiteral("VOLUME"), volume);

    xml.writeEmptyElement(QStringLiteral("ALBUM"));
    xml.writeAttribute(QStringLiteral("TITLE"), t.album);

    xml.writeEmptyElement(QStringLiteral("INFO"));
    xml.writeAttribute(QStringLiteral("GENRE"), t.genre);
    if (!t.comment.isEmpty())
        xml.writeAttribute(QStringLiteral("COMMENT"), t.comment);
    if (!t.year.isEmpty())
        xml.writeAttribute(QStringLiteral("RELEASE_DATE"), t.year);
    xml.writeAttribute(QStringLiteral("PLAYTIME"), QString::number(std::lround(t.duration)));

    xml.writeEmptyElement(QStringLiteral("TEMPO"));
    xml.writeAttribute(QStringLiteral("BPM"), LibraryCodec::numberString(t.bpm, 6));
    xml.writeAttribute(QStringLiteral("BPM_QUALITY"), QStringLiteral("100"));

    int pitchClass = kPitchClassNames.indexOf(t.key);
    if (pitchClass >= 0) {
        xml.writeEmptyElement(QStringLiteral("MUSICAL_KEY"));
        xml.writeAttribute(QStringLiteral("VALUE"), QString::number(pitchClass));
    }
    xml.writeEmptyElement(QStringLiteral("KEY"));
    xml.writeAttribute(QStringLiteral("VALUE"), t.key);

    for (const CueMarker& cue : t.cuePoints) {
        std::optional<int> code = NmlCodec::codeForCueType(cue.type);
        if (!code) {
            qDebug() << kLog << "Dropping" << cueTypeName(cue.type) << "cue of" << t.title;
            continue;
        }
        xml.writeEmptyElement(QStringLiteral("CUE_V2"));
        xml.writeAttribute(QStringLiteral("NAME"), cue.label);
        xml.writeAttribute(QStringLiteral("TYPE"), QString::number(*code));
        xml.writeAttribute(QStringLiteral("START"), LibraryCodec::numberString(cue.startSecs * 1000.0, 3));
        xml.writeAttribute(QStringLiteral("LEN"), QStringLiteral("0.000"));
        xml.writeAttribute(QStringLiteral("HOTCUE"),
                           QString::number(cue.type == CueType::HotCue ? cue.hotCueIndex : -1));
    }

    xml.writeEndElement(); // ENTRY
}

ExportResult NmlCodec::write(const QString& filePath, const LibraryDocument& document)
{
    ExportResult result;

    QSaveFile file(filePath);
    if (!LibraryCodec::openForWriting(file, result, kLog))
        return result;

    // Mint identities before anything references them
    QVector<QString> minted;
    minted.reserve(document.tracks.size());
    for (const Track& t : document.tracks) {
        QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        minted.append(id);
        if (!t.id.isEmpty())
            result.identities.insert(t.id, id);
    }

    QXmlStreamWriter xml(&file);
    xml.setAutoFormatting(true);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("NML"));
    xml.writeAttribute(QStringLiteral("VERSION"), QString::fromLatin1(kVersion));

    xml.writeEmptyElement(QStringLiteral("HEAD"));
    xml.writeAttribute(QStringLiteral("COMPANY"), QStringLiteral("CrateBridge"));
    xml.writeAttribute(QStringLiteral("PROGRAM"), QStringLiteral("CrateBridge"));

    xml.writeEmptyElement(QStringLiteral("MUSICFOLDERS"));

    xml.writeStartElement(QStringLiteral("COLLECTION"));
    xml.writeAttribute(QStringLiteral("ENTRIES"), QString::number(document.tracks.size()));
    for (int i = 0; i < document.tracks.size(); ++i)
        writeEntry(xml, document.tracks[i], minted[i]);
    xml.writeEndElement(); // COLLECTION
    result.tracksWritten = document.tracks.size();

    xml.writeStartElement(QStringLiteral("SETS"));
    for (const Playlist& p : document.playlists) {
        QStringList refs = LibraryCodec::mapReferences(p.trackIds, result.identities,
                                                       result.droppedReferences);
        xml.writeStartElement(QStringLiteral("NODE"));
        xml.writeAttribute(QStringLiteral("TYPE"), QStringLiteral("PLAYLIST"));
        xml.writeAttribute(QStringLiteral("NAME"), p.name);
        for (const QString& ref : refs) {
            xml.writeEmptyElement(QStringLiteral("NODE"));
            xml.writeAttribute(QStringLiteral("TYPE"), QStringLiteral("TRACK"));
            xml.writeAttribute(QStringLiteral("KEY"), ref);
        }
        xml.writeEndElement(); // NODE
        ++result.playlistsWritten;
    }
    xml.writeEndElement(); // SETS

    xml.writeEndElement(); // NML
    xml.writeEndDocument();

    if (xml.hasError()) {
        file.cancelWriting();
        result.errorMessage = QStringLiteral("Failed to serialise NML: %1").arg(file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }
    if (!LibraryCodec::commit(file, result, kLog))
        return result;

    if (result.droppedReferences > 0)
        qDebug() << kLog << "Dropped" << result.droppedReferences << "unmapped playlist references";
    qDebug() << kLog << "Wrote" << result.tracksWritten << "entries,"
             << result.playlistsWritten << "playlists to" << filePath;
    return result;
}
