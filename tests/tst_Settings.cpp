#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "Settings.h"

class tst_Settings : public QObject {
    Q_OBJECT

private slots:
    void init()
    {
        QVERIFY(m_dir.isValid());
        QFile::remove(iniPath());
    }

    // ── Defaults ─────────────────────────────────────────────────
    void defaults_whenFileIsEmpty()
    {
        Settings s(iniPath());
        QVERIFY(s.libraryFolders().isEmpty());
        QVERIFY(s.analysisEnabled());
        QCOMPARE(s.analysisSampleRate(), 22050);
        QCOMPARE(s.tempoOffset(), 30.0);
        QCOMPARE(s.tempoDuration(), 30.0);
        QCOMPARE(s.keyDuration(), 20.0);
        QCOMPARE(s.energyDuration(), 15.0);
        QCOMPARE(s.cueRetention(), QStringLiteral("all"));
        QCOMPARE(s.missingFilePolicy(), QStringLiteral("skip"));
        QVERIFY(!s.locateMissingFiles());
        QVERIFY(!s.mapFirstHotCueToMemory());
        QVERIFY(!s.mapMemoryToHotCue());
    }

    // ── Library folders ──────────────────────────────────────────
    void addLibraryFolder_ignoresDuplicates()
    {
        Settings s(iniPath());
        QSignalSpy spy(&s, &Settings::libraryFoldersChanged);

        s.addLibraryFolder(QStringLiteral("/music/a"));
        s.addLibraryFolder(QStringLiteral("/music/b"));
        s.addLibraryFolder(QStringLiteral("/music/a"));

        QCOMPARE(s.libraryFolders(),
                 QStringList({QStringLiteral("/music/a"), QStringLiteral("/music/b")}));
        QCOMPARE(spy.count(), 2);  // duplicate emits nothing
    }

    void removeLibraryFolder()
    {
        Settings s(iniPath());
        s.setLibraryFolders({QStringLiteral("/a"), QStringLiteral("/b")});
        s.removeLibraryFolder(QStringLiteral("/a"));
        QCOMPARE(s.libraryFolders(), QStringList({QStringLiteral("/b")}));
    }

    // ── Persistence ──────────────────────────────────────────────
    void values_surviveReopen()
    {
        {
            Settings s(iniPath());
            s.setKeyWindow(45.0, 10.0);
            s.setTempoWindow(0.0, 60.0);
            s.setEnergyWindow(5.0, 5.0);
            s.setAnalysisSampleRate(44100);
            s.setAnalysisEnabled(false);
            s.setCueRetention(QStringLiteral("first8"));
            s.setMapMemoryToHotCue(true);
            s.sync();
        }

        Settings s(iniPath());
        QCOMPARE(s.keyOffset(), 45.0);
        QCOMPARE(s.keyDuration(), 10.0);
        QCOMPARE(s.tempoOffset(), 0.0);
        QCOMPARE(s.tempoDuration(), 60.0);
        QCOMPARE(s.energyOffset(), 5.0);
        QCOMPARE(s.energyDuration(), 5.0);
        QCOMPARE(s.analysisSampleRate(), 44100);
        QVERIFY(!s.analysisEnabled());
        QCOMPARE(s.cueRetention(), QStringLiteral("first8"));
        QVERIFY(s.mapMemoryToHotCue());
        QCOMPARE(QFileInfo(s.fileName()).fileName(), QStringLiteral("settings.ini"));
    }

private:
    QString iniPath() const { return m_dir.filePath(QStringLiteral("settings.ini")); }

    QTemporaryDir m_dir;
};

QTEST_MAIN(tst_Settings)
#include "tst_Settings.moc"
