#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>
#include <optional>

// ── Cue Types ───────────────────────────────────────────────────────
enum class CueType {
    HotCue,
    Loop,
    Grid,
    Beat,
    Memory      // only rekordbox has a home for these
};

struct CueMarker {
    CueType type = CueType::HotCue;
    double  startSecs = 0.0;
    QString label;
    int     hotCueIndex = -1;   // NML HOTCUE slot, -1 when unassigned
};

// ── Library Formats ─────────────────────────────────────────────────
// Closed set. Adding a format means adding an enumerator plus one codec.
enum class LibraryFormat {
    Nml,            // Traktor collection
    RekordboxXml,   // rekordbox DJ_PLAYLISTS export
    Csv,
    M3u
};

std::optional<LibraryFormat> formatFromExtension(const QString& filePath);
std::optional<LibraryFormat> formatFromName(const QString& name);
QString formatName(LibraryFormat format);

// ── Data Structs ────────────────────────────────────────────────────
struct Track {
    QString id;             // identity within the document it came from
    QString filePath;       // absolute, stable key within one run

    QString title;
    QString artist;
    QString album;
    QString genre;
    QString year;
    QString comment;

    double  bpm = 0.0;      // 0 = unknown
    QString key = QStringLiteral("Unknown");
    int     energy = 0;     // 0-100
    double  duration = 0.0; // seconds, 0 = unknown

    bool    isCorrupt = false;
    QString errorMessage;

    QVector<CueMarker> cuePoints;

    // Track with every descriptive/analytic field at its safe default
    static Track defaults(const QString& filePath);

    // Fill empty descriptive fields with placeholders, keep the rest
    void applyDefaults();

    bool isPlayable() const { return !isCorrupt && !filePath.isEmpty(); }

    QVariantMap toRecord() const;
};

struct Playlist {
    QString     name;
    QStringList trackIds;   // Track::id values of the same document
};

struct LibraryDocument {
    QVector<Track>    tracks;
    QVector<Playlist> playlists;

    int indexOfTrack(const QString& id) const;
};

// ── Filtering ───────────────────────────────────────────────────────
struct TrackFilter {
    QString genre;                  // case-insensitive, empty = any
    std::optional<double> bpmMin;
    std::optional<double> bpmMax;
    QString key;                    // exact, empty = any
};

QVector<Track> filterTracks(const QVector<Track>& tracks, const TrackFilter& filter);
QVector<Track> removeCorrupt(const QVector<Track>& tracks);

// ── Utility Functions ───────────────────────────────────────────────
extern const QStringList kPitchClassNames;

QString unknownArtist();
QString unknownAlbum();
QString unknownGenre();
QString titleFromPath(const QString& filePath);

// Map a tag value ("Am", "Bb", "F# minor") to one of kPitchClassNames
std::optional<QString> normalizeKey(const QString& tagValue);

QString cueTypeName(CueType type);
QString formatDuration(double seconds);

#endif // MUSICDATA_H
