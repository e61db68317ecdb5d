#pragma once

#include <QObject>
#include <QSettings>
#include <QStringList>

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // Standalone settings on an explicit INI file (tests, --settings)
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    static QString settingsPath();
    QString fileName() const { return m_settings.fileName(); }

    // ── Library ──────────────────────────────────────────────────────
    QStringList libraryFolders() const;
    void setLibraryFolders(const QStringList& folders);
    void addLibraryFolder(const QString& folder);
    void removeLibraryFolder(const QString& folder);

    // ── Analysis ─────────────────────────────────────────────────────
    bool analysisEnabled() const;
    void setAnalysisEnabled(bool enabled);

    int analysisSampleRate() const;
    void setAnalysisSampleRate(int rate);

    // Excerpt windows in seconds: offset into the file, then length
    double tempoOffset() const;
    double tempoDuration() const;
    double keyOffset() const;
    double keyDuration() const;
    double energyOffset() const;
    double energyDuration() const;
    void setTempoWindow(double offset, double duration);
    void setKeyWindow(double offset, double duration);
    void setEnergyWindow(double offset, double duration);

    // ── Migration defaults ───────────────────────────────────────────
    // "all", "first8" or "none"
    QString cueRetention() const;
    void setCueRetention(const QString& mode);

    // "skip" or "include"
    QString missingFilePolicy() const;
    void setMissingFilePolicy(const QString& policy);

    bool locateMissingFiles() const;
    void setLocateMissingFiles(bool enabled);

    bool mapFirstHotCueToMemory() const;
    void setMapFirstHotCueToMemory(bool enabled);

    bool mapMemoryToHotCue() const;
    void setMapMemoryToHotCue(bool enabled);

    void sync() { m_settings.sync(); }

signals:
    void libraryFoldersChanged(const QStringList& folders);

private:
    explicit Settings(QObject* parent = nullptr);
    QSettings m_settings;
};
