#include "MusicData.h"

#include <QFileInfo>
#include <QVariantList>

// ═════════════════════════════════════════════════════════════════════
//  Utility Functions
// ═════════════════════════════════════════════════════════════════════

const QStringList kPitchClassNames = {
    QStringLiteral("C"),  QStringLiteral("C#"), QStringLiteral("D"),
    QStringLiteral("D#"), QStringLiteral("E"),  QStringLiteral("F"),
    QStringLiteral("F#"), QStringLiteral("G"),  QStringLiteral("G#"),
    QStringLiteral("A"),  QStringLiteral("A#"), QStringLiteral("B")
};

QString unknownArtist() { return QStringLiteral("Unknown Artist"); }
QString unknownAlbum()  { return QStringLiteral("Unknown Album"); }
QString unknownGenre()  { return QStringLiteral("Unknown Genre"); }

QString titleFromPath(const QString& filePath)
{
    return QFileInfo(filePath).completeBaseName();
}

QString formatDuration(double seconds)
{
    int total = static_cast<int>(seconds + 0.5);
    int m = total / 60;
    int s = total % 60;
    return QString("%1:%2").arg(m).arg(s, 2, 10, QChar('0'));
}

QString cueTypeName(CueType type)
{
    switch (type) {
    case CueType::HotCue: return QStringLiteral("hot-cue");
    case CueType::Loop:   return QStringLiteral("loop");
    case CueType::Grid:   return QStringLiteral("grid");
    case CueType::Beat:   return QStringLiteral("beat");
    case CueType::Memory: return QStringLiteral("memory");
    }
    return QStringLiteral("hot-cue");
}

std::optional<QString> normalizeKey(const QString& tagValue)
{
    QString v = tagValue.trimmed();
    if (v.isEmpty())
        return std::nullopt;

    QChar letter = v.at(0).toUpper();
    static const QString kNaturals = QStringLiteral("CDEFGAB");
    static const int kNaturalIndex[] = {0, 2, 4, 5, 7, 9, 11};
    int pos = kNaturals.indexOf(letter);
    if (pos < 0)
        return std::nullopt;

    int pc = kNaturalIndex[pos];
    QString rest = v.mid(1);
    if (rest.startsWith(QLatin1Char('#')) || rest.startsWith(QChar(0x266F))) {
        pc += 1;
        rest = rest.mid(1);
    } else if (rest.startsWith(QLatin1Char('b')) || rest.startsWith(QChar(0x266D))) {
        pc += 11;
        rest = rest.mid(1);
    }

    // Whatever follows must be a mode marker, not more notation
    rest = rest.trimmed().toLower();
    static const QStringList kModeSuffixes = {
        QString(), QStringLiteral("m"), QStringLiteral("min"), QStringLiteral("minor"),
        QStringLiteral("maj"), QStringLiteral("major"), QStringLiteral("dur"),
        QStringLiteral("moll")
    };
    if (!kModeSuffixes.contains(rest))
        return std::nullopt;

    return kPitchClassNames.at(pc % 12);
}

// ── Library Formats ─────────────────────────────────────────────────

std::optional<LibraryFormat> formatFromExtension(const QString& filePath)
{
    QString ext = QFileInfo(filePath).suffix().toLower();
    if (ext == "nml")                  return LibraryFormat::Nml;
    if (ext == "xml")                  return LibraryFormat::RekordboxXml;
    if (ext == "csv")                  return LibraryFormat::Csv;
    if (ext == "m3u" || ext == "m3u8") return LibraryFormat::M3u;
    return std::nullopt;
}

std::optional<LibraryFormat> formatFromName(const QString& name)
{
    QString n = name.trimmed().toLower();
    if (n == "nml" || n == "traktor")                     return LibraryFormat::Nml;
    if (n == "rekordbox" || n == "xml")                   return LibraryFormat::RekordboxXml;
    if (n == "csv")                                       return LibraryFormat::Csv;
    if (n == "m3u" || n == "m3u8")                        return LibraryFormat::M3u;
    return std::nullopt;
}

QString formatName(LibraryFormat format)
{
    switch (format) {
    case LibraryFormat::Nml:          return QStringLiteral("Traktor NML");
    case LibraryFormat::RekordboxXml: return QStringLiteral("rekordbox XML");
    case LibraryFormat::Csv:          return QStringLiteral("CSV");
    case LibraryFormat::M3u:          return QStringLiteral("M3U");
    }
    return QStringLiteral("Unknown");
}

// ═════════════════════════════════════════════════════════════════════
//  Track
// ═════════════════════════════════════════════════════════════════════

Track Track::defaults(const QString& filePath)
{
    Track t;
    t.filePath = filePath;
    t.title    = titleFromPath(filePath);
    t.artist   = unknownArtist();
    t.album    = unknownAlbum();
    t.genre    = unknownGenre();
    t.bpm      = 0.0;
    t.key      = QStringLiteral("Unknown");
    t.energy   = 0;
    t.duration = 0.0;
    return t;
}

void Track::applyDefaults()
{
    if (title.trimmed().isEmpty())  title  = titleFromPath(filePath);
    if (artist.trimmed().isEmpty()) artist = unknownArtist();
    if (album.trimmed().isEmpty())  album  = unknownAlbum();
    if (genre.trimmed().isEmpty())  genre  = unknownGenre();
    if (key.trimmed().isEmpty())    key    = QStringLiteral("Unknown");
    if (bpm < 0.0)                  bpm    = 0.0;
    if (duration < 0.0)             duration = 0.0;
    energy = qBound(0, energy, 100);
}

QVariantMap Track::toRecord() const
{
    QVariantList cues;
    for (const CueMarker& c : cuePoints) {
        QVariantMap m;
        m.insert(QStringLiteral("type"), cueTypeName(c.type));
        m.insert(QStringLiteral("start"), c.startSecs);
        m.insert(QStringLiteral("label"), c.label);
        cues.append(m);
    }

    QVariantMap r;
    r.insert(QStringLiteral("id"), id);
    r.insert(QStringLiteral("file_path"), filePath);
    r.insert(QStringLiteral("title"), title);
    r.insert(QStringLiteral("artist"), artist);
    r.insert(QStringLiteral("album"), album);
    r.insert(QStringLiteral("genre"), genre);
    r.insert(QStringLiteral("year"), year);
    r.insert(QStringLiteral("comment"), comment);
    r.insert(QStringLiteral("bpm"), bpm);
    r.insert(QStringLiteral("key"), key);
    r.insert(QStringLiteral("energy"), energy);
    r.insert(QStringLiteral("duration"), duration);
    r.insert(QStringLiteral("is_corrupt"), isCorrupt);
    r.insert(QStringLiteral("error_message"), errorMessage);
    r.insert(QStringLiteral("cue_points"), cues);
    return r;
}

int LibraryDocument::indexOfTrack(const QString& id) const
{
    for (int i = 0; i < tracks.size(); ++i) {
        if (tracks[i].id == id)
            return i;
    }
    return -1;
}

// ── Filtering ───────────────────────────────────────────────────────

QVector<Track> filterTracks(const QVector<Track>& tracks, const TrackFilter& filter)
{
    QVector<Track> out;
    for (const Track& t : tracks) {
        if (!filter.genre.isEmpty()
            && t.genre.compare(filter.genre, Qt::CaseInsensitive) != 0)
            continue;
        if (filter.bpmMin && t.bpm < *filter.bpmMin)
            continue;
        if (filter.bpmMax && t.bpm > *filter.bpmMax)
            continue;
        if (!filter.key.isEmpty() && t.key != filter.key)
            continue;
        out.append(t);
    }
    return out;
}

QVector<Track> removeCorrupt(const QVector<Track>& tracks)
{
    QVector<Track> out;
    out.reserve(tracks.size());
    for (const Track& t : tracks) {
        if (!t.isCorrupt)
            out.append(t);
    }
    return out;
}
