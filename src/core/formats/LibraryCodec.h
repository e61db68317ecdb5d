#pragma once

#include "../MusicData.h"

#include <QHash>
#include <QString>
#include <QVector>

class QSaveFile;

// One entry of a foreign document that did not make it into the model
struct SkipRecord {
    QString entry;      // entry identity as the document names it (ID, row, path)
    QString reason;
};

struct ReadOptions {
    // true: entries whose audio file is gone are skipped (and logged).
    // false: they are kept, flagged corrupt with "File does not exist".
    bool skipMissingFiles = true;
};

struct ImportResult {
    bool ok = false;
    QString errorMessage;
    LibraryDocument document;
    QVector<SkipRecord> skipped;
};

// Track::id of the written model -> identity minted in the target document
using IdentityMap = QHash<QString, QString>;

struct ExportResult {
    bool ok = false;
    QString errorMessage;
    IdentityMap identities;
    int tracksWritten = 0;
    int playlistsWritten = 0;
    int droppedReferences = 0;  // playlist entries whose track got no identity
};

// Entry point over the closed format set
class LibraryCodec {
public:
    static ImportResult read(LibraryFormat format, const QString& filePath,
                             const ReadOptions& options = ReadOptions());
    static ExportResult write(LibraryFormat format, const QString& filePath,
                              const LibraryDocument& document);

    // ── Helpers shared by the codecs ────────────────────────────────

    // Apply the missing-file half of the read contract to a freshly built
    // track. Returns false when the entry must be skipped.
    static bool admitReferencedFile(Track& track, const ReadOptions& options,
                                    const QString& entry, QVector<SkipRecord>& skipped,
                                    const char* component);

    // Remove playlist references to ids that are not in the document
    static int pruneDanglingReferences(LibraryDocument& document);

    // Playlist ids rewritten through `identities`; unmapped ones are dropped
    static QStringList mapReferences(const QStringList& trackIds,
                                     const IdentityMap& identities, int& dropped);

    static bool openForWriting(QSaveFile& file, ExportResult& result,
                               const char* component);
    static bool commit(QSaveFile& file, ExportResult& result, const char* component);

    static QString numberString(double value, int decimals);
};
