#include "LibraryScanner.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QSet>
#include <QtConcurrent>

#include <algorithm>

LibraryScanner::LibraryScanner(const MetadataResolver& resolver, QObject* parent)
    : QObject(parent)
    , m_resolver(resolver)
{
}

// ── Folders ─────────────────────────────────────────────────────────
bool LibraryScanner::addFolder(const QString& folder)
{
    QFileInfo fi(folder);
    if (!fi.exists() || !fi.isDir()) {
        qWarning() << "[SCAN] Folder does not exist:" << folder;
        return false;
    }
    const QString path = fi.absoluteFilePath();
    if (!m_folders.contains(path))
        m_folders.append(path);
    return true;
}

void LibraryScanner::removeFolder(const QString& folder)
{
    m_folders.removeAll(QFileInfo(folder).absoluteFilePath());
}

void LibraryScanner::clearFolders()
{
    m_folders.clear();
}

// ── Directory walk ──────────────────────────────────────────────────
void LibraryScanner::walkDirectory(const QString& dir, QStringList& files, CancellationToken* token)
{
    if (CancellationToken::canceled(token)) return;

    const QFileInfoList entries = QDir(dir).entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks | QDir::Readable,
        QDir::Name);

    for (const QFileInfo& fi : entries) {
        if (CancellationToken::canceled(token)) return;

        if (fi.isDir()) {
            walkDirectory(fi.absoluteFilePath(), files, token);
            continue;
        }
        if (!MetadataResolver::isSupportedFile(fi.fileName()))
            continue;
        // Below the corruption threshold: not part of the library at all
        if (fi.size() < MetadataResolver::kMinFileSize)
            continue;
        files.append(fi.absoluteFilePath());
    }
}

QStringList LibraryScanner::discoverFiles(const QStringList& folders, CancellationToken* token)
{
    // Parallel walk across folders
    QList<QStringList> perFolderFiles = QtConcurrent::blockingMapped(
        folders, [token](const QString& folder) -> QStringList {
            QElapsedTimer folderTimer; folderTimer.start();
            QStringList files;
            if (CancellationToken::canceled(token))
                return files;
            QFileInfo folderInfo(folder);
            if (!folderInfo.exists() || !folderInfo.isReadable()) {
                qDebug() << "[SCAN] Folder not accessible, skipping:" << folder;
                return files;
            }
            walkDirectory(folderInfo.absoluteFilePath(), files, token);
            qDebug() << "[SCAN] Walked" << folder << ":" << files.size()
                     << "files in" << folderTimer.elapsed() << "ms";
            return files;
        });

    QSet<QString> seen;
    QStringList allFiles;
    for (const QStringList& list : perFolderFiles) {
        for (const QString& f : list) {
            if (!seen.contains(f)) {
                seen.insert(f);
                allFiles.append(f);
            }
        }
    }
    std::sort(allFiles.begin(), allFiles.end());
    return allFiles;
}

// ── scan ────────────────────────────────────────────────────────────
ScanResult LibraryScanner::scan(CancellationToken* token, const ProgressCallback& progress)
{
    ScanResult result;
    if (m_scanning.exchange(true)) {
        qWarning() << "[SCAN] A scan is already running";
        result.rejected = true;
        return result;
    }

    emit scanStarted();
    ProgressReporter reporter(progress);
    QElapsedTimer timer; timer.start();

    qDebug() << "[SCAN] Starting scan of" << m_folders.size() << "folders";
    reporter.report(0, QStringLiteral("Discovering files"));

    const QStringList files = discoverFiles(m_folders, token);
    result.filesDiscovered = files.size();
    // A token seen after the walk may have cut discovery short
    result.canceled = CancellationToken::canceled(token);
    qDebug() << "[SCAN] Directory walk:" << timer.elapsed() << "ms -"
             << files.size() << "files";

    const int total = files.size();
    for (int i = 0; i < total; ++i) {
        if (CancellationToken::canceled(token)) {
            result.canceled = true;
            break;
        }

        result.tracks.append(m_resolver.resolve(files[i]));

        const int processed = i + 1;
        reporter.reportRange(0, 100, processed, total,
                             QStringLiteral("Scanned %1").arg(QFileInfo(files[i]).fileName()),
                             processed, total);
        emit scanProgress(processed, total);
    }

    if (result.canceled) {
        qDebug() << "[SCAN] Canceled after" << result.tracks.size() << "of" << total << "files";
    } else {
        m_tracks = result.tracks;
        reporter.report(100, QStringLiteral("Scan complete"), total, total);
        int corrupt = 0;
        for (const Track& t : result.tracks)
            if (t.isCorrupt) ++corrupt;
        qDebug() << "[SCAN] Finished:" << result.tracks.size() << "tracks," << corrupt
                 << "corrupt in" << timer.elapsed() << "ms";
    }

    m_scanning = false;
    emit scanFinished(result.tracks.size(), result.canceled);
    return result;
}
