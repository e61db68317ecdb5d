#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

// ── Settings INI path ───────────────────────────────────────────────
// <AppConfigLocation>/settings.ini, e.g. ~/.config/CrateBridge/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Library folders ─────────────────────────────────────────────────
QStringList Settings::libraryFolders() const
{
    return m_settings.value(QStringLiteral("library/folders")).toStringList();
}

void Settings::setLibraryFolders(const QStringList& folders)
{
    m_settings.setValue(QStringLiteral("library/folders"), folders);
    emit libraryFoldersChanged(folders);
}

void Settings::addLibraryFolder(const QString& folder)
{
    QStringList folders = libraryFolders();
    if (!folders.contains(folder)) {
        folders.append(folder);
        setLibraryFolders(folders);
    }
}

void Settings::removeLibraryFolder(const QString& folder)
{
    QStringList folders = libraryFolders();
    folders.removeAll(folder);
    setLibraryFolders(folders);
}

// ── Analysis ────────────────────────────────────────────────────────
bool Settings::analysisEnabled() const
{
    return m_settings.value(QStringLiteral("analysis/enabled"), true).toBool();
}

void Settings::setAnalysisEnabled(bool enabled)
{
    m_settings.setValue(QStringLiteral("analysis/enabled"), enabled);
}

int Settings::analysisSampleRate() const
{
    return m_settings.value(QStringLiteral("analysis/sampleRate"), 22050).toInt();
}

void Settings::setAnalysisSampleRate(int rate)
{
    m_settings.setValue(QStringLiteral("analysis/sampleRate"), rate);
}

double Settings::tempoOffset() const
{
    return m_settings.value(QStringLiteral("analysis/tempoOffset"), 30.0).toDouble();
}

double Settings::tempoDuration() const
{
    return m_settings.value(QStringLiteral("analysis/tempoDuration"), 30.0).toDouble();
}

double Settings::keyOffset() const
{
    return m_settings.value(QStringLiteral("analysis/keyOffset"), 30.0).toDouble();
}

double Settings::keyDuration() const
{
    return m_settings.value(QStringLiteral("analysis/keyDuration"), 20.0).toDouble();
}

double Settings::energyOffset() const
{
    return m_settings.value(QStringLiteral("analysis/energyOffset"), 30.0).toDouble();
}

double Settings::energyDuration() const
{
    return m_settings.value(QStringLiteral("analysis/energyDuration"), 15.0).toDouble();
}

void Settings::setTempoWindow(double offset, double duration)
{
    m_settings.setValue(QStringLiteral("analysis/tempoOffset"), offset);
    m_settings.setValue(QStringLiteral("analysis/tempoDuration"), duration);
}

void Settings::setKeyWindow(double offset, double duration)
{
    m_settings.setValue(QStringLiteral("analysis/keyOffset"), offset);
    m_settings.setValue(QStringLiteral("analysis/keyDuration"), duration);
}

void Settings::setEnergyWindow(double offset, double duration)
{
    m_settings.setValue(QStringLiteral("analysis/energyOffset"), offset);
    m_settings.setValue(QStringLiteral("analysis/energyDuration"), duration);
}

// ── Migration defaults ──────────────────────────────────────────────
QString Settings::cueRetention() const
{
    return m_settings.value(QStringLiteral("migration/cueRetention"),
                            QStringLiteral("all")).toString();
}

void Settings::setCueRetention(const QString& mode)
{
    m_settings.setValue(QStringLiteral("migration/cueRetention"), mode);
}

QString Settings::missingFilePolicy() const
{
    return m_settings.value(QStringLiteral("migration/missingFiles"),
                            QStringLiteral("skip")).toString();
}

void Settings::setMissingFilePolicy(const QString& policy)
{
    m_settings.setValue(QStringLiteral("migration/missingFiles"), policy);
}

bool Settings::locateMissingFiles() const
{
    return m_settings.value(QStringLiteral("migration/locateMissing"), false).toBool();
}

void Settings::setLocateMissingFiles(bool enabled)
{
    m_settings.setValue(QStringLiteral("migration/locateMissing"), enabled);
}

bool Settings::mapFirstHotCueToMemory() const
{
    return m_settings.value(QStringLiteral("migration/mapFirstHotCueToMemory"), false).toBool();
}

void Settings::setMapFirstHotCueToMemory(bool enabled)
{
    m_settings.setValue(QStringLiteral("migration/mapFirstHotCueToMemory"), enabled);
}

bool Settings::mapMemoryToHotCue() const
{
    return m_settings.value(QStringLiteral("migration/mapMemoryToHotCue"), false).toBool();
}

void Settings::setMapMemoryToHotCue(bool enabled)
{
    m_settings.setValue(QStringLiteral("migration/mapMemoryToHotCue"), enabled);
}
