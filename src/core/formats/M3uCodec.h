#pragma once

#include "LibraryCodec.h"

#include <QStringConverter>

// Extended M3U playlist. The whole file is one playlist; ".m3u8" is UTF-8,
// ".m3u" is Latin-1.
class M3uCodec {
public:
    // Relative paths may climb at most this many directories on export
    static constexpr int kMaxParentTraversal = 2;

    static ImportResult read(const QString& filePath, const ReadOptions& options = ReadOptions());
    static ExportResult write(const QString& filePath, const LibraryDocument& document);

    static QStringConverter::Encoding encodingFor(const QString& filePath);

    // Path as it should appear in a playlist written to `playlistDir`
    static QString entryPath(const QString& trackPath, const QString& playlistDir);
};
