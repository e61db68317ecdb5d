#pragma once

#include "LibraryCodec.h"

#include <optional>

class QXmlStreamReader;

// rekordbox DJ_PLAYLISTS export. TrackIDs are 1..N, minted on every write
// and not stable across exports.
class RekordboxXmlCodec {
public:
    static ImportResult read(const QString& filePath, const ReadOptions& options = ReadOptions());
    static ExportResult write(const QString& filePath, const LibraryDocument& document);

    // POSITION_MARK Type codes: 0 hot cue, 1 loop, 2 memory, 4 grid
    static std::optional<CueType> cueTypeFromCode(int code);
    static int codeForCueType(CueType type);

    // file://localhost/<percent-encoded path> <-> local path
    static QString locationFromPath(const QString& filePath);
    static QString pathFromLocation(const QString& location);

    static QString kindForPath(const QString& filePath);

private:
    static void readCollection(QXmlStreamReader& xml, const ReadOptions& options,
                               ImportResult& result);
    static void readPlaylistNode(QXmlStreamReader& xml, ImportResult& result,
                                 const QHash<QString, QString>& idByLocation);
};
