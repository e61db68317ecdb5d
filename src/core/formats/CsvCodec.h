#pragma once

#include "LibraryCodec.h"

#include <QStringList>
#include <QVector>

// Flat track table, one row per track, no playlists.
class CsvCodec {
public:
    static ImportResult read(const QString& filePath, const ReadOptions& options = ReadOptions());
    static ExportResult write(const QString& filePath, const LibraryDocument& document);

    static const QStringList& writerHeader();

    // RFC 4180 records; quoted fields may span lines
    static QVector<QStringList> parse(const QString& text);
    static QString quoteField(const QString& field);
};
