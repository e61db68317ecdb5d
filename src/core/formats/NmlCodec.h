#pragma once

#include "LibraryCodec.h"

#include <optional>

class QXmlStreamReader;

// Traktor NML collection: HEAD, COLLECTION of ENTRY, SETS of playlist NODEs.
// Entry identity is a UUID string minted on every write.
class NmlCodec {
public:
    static constexpr const char* kVersion = "19";

    static ImportResult read(const QString& filePath, const ReadOptions& options = ReadOptions());
    static ExportResult write(const QString& filePath, const LibraryDocument& document);

    // CUE_V2 TYPE codes: 0 hot cue, 1 loop, 4 grid, 9 beat
    static std::optional<CueType> cueTypeFromCode(int code);
    static std::optional<int> codeForCueType(CueType type);

    // "/:Users/:dj/:Music/:" + "a.mp3" (+ volume) <-> absolute path
    static QString joinLocation(const QString& volume, const QString& dir, const QString& file);
    static void splitLocation(const QString& filePath, QString& volume, QString& dir, QString& file);

private:
    static void readCollection(QXmlStreamReader& xml, const ReadOptions& options,
                               ImportResult& result);
    static void readSets(QXmlStreamReader& xml, ImportResult& result);
    static void readPlaylistNode(QXmlStreamReader& xml, ImportResult& result);
};
