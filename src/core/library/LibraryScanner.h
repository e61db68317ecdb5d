#pragma once

#include "MetadataResolver.h"
#include "../CancellationToken.h"
#include "../ProgressReporter.h"

#include <QObject>
#include <QStringList>
#include <QVector>
#include <atomic>

struct ScanResult {
    QVector<Track> tracks;      // exactly the files processed, in path order
    bool canceled = false;      // stopped early by the token
    bool rejected = false;      // another scan was already running; nothing done
    int filesDiscovered = 0;
};

class LibraryScanner : public QObject {
    Q_OBJECT

public:
    explicit LibraryScanner(const MetadataResolver& resolver = MetadataResolver(),
                            QObject* parent = nullptr);

    // Missing folders are rejected; duplicates are ignored
    bool addFolder(const QString& folder);
    void removeFolder(const QString& folder);
    void clearFolders();
    QStringList folders() const { return m_folders; }

    bool isScanning() const { return m_scanning; }

    // Walk every registered folder, then resolve the files one by one.
    // The token is polled per folder, directory and file.
    ScanResult scan(CancellationToken* token = nullptr,
                    const ProgressCallback& progress = ProgressCallback());

    // Library state of the last scan that ran to completion
    const QVector<Track>& tracks() const { return m_tracks; }

    // Supported audio files of at least MetadataResolver::kMinFileSize bytes,
    // de-duplicated and sorted by path
    static QStringList discoverFiles(const QStringList& folders, CancellationToken* token = nullptr);

signals:
    void scanStarted();
    void scanProgress(int current, int total);
    void scanFinished(int tracksFound, bool canceled);

private:
    static void walkDirectory(const QString& dir, QStringList& files, CancellationToken* token);

    MetadataResolver m_resolver;
    QStringList m_folders;
    QVector<Track> m_tracks;
    std::atomic<bool> m_scanning{false};
};
