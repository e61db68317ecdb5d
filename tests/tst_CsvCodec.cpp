#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "TestAudio.h"
#include "CsvCodec.h"

class tst_CsvCodec : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
        QVERIFY(QDir(m_dir.path()).mkpath(QStringLiteral("music")));
        for (const char* name : {"music/a.mp3", "music/b, the \"remix\".wav", "music/c.flac"})
            QVERIFY(TestAudio::touch(m_dir.filePath(QString::fromLatin1(name))));
    }

    // ── Parser ───────────────────────────────────────────────────
    void parse_quotedFields()
    {
        auto rows = CsvCodec::parse(QStringLiteral(
            "name,path\r\n"
            "\"Hello, World\",/a.mp3\r\n"
            "\"Say \"\"hi\"\"\",/b.mp3\n"
            "\"multi\nline\",/c.mp3"));
        QCOMPARE(rows.size(), 4);
        QCOMPARE(rows[1], QStringList({QStringLiteral("Hello, World"), QStringLiteral("/a.mp3")}));
        QCOMPARE(rows[2].at(0), QStringLiteral("Say \"hi\""));
        QCOMPARE(rows[3].at(0), QStringLiteral("multi\nline"));
        QCOMPARE(rows[3].at(1), QStringLiteral("/c.mp3"));
    }

    void parse_emptyFieldsAndBlankLines()
    {
        auto rows = CsvCodec::parse(QStringLiteral("a,,c\n\n,\n"));
        QCOMPARE(rows.size(), 2);
        QCOMPARE(rows[0], QStringList({QStringLiteral("a"), QString(), QStringLiteral("c")}));
        QCOMPARE(rows[1], QStringList({QString(), QString()}));
    }

    void quoteField_onlyWhenNeeded()
    {
        QCOMPARE(CsvCodec::quoteField(QStringLiteral("plain")), QStringLiteral("plain"));
        QCOMPARE(CsvCodec::quoteField(QStringLiteral("a,b")), QStringLiteral("\"a,b\""));
        QCOMPARE(CsvCodec::quoteField(QStringLiteral("say \"x\"")),
                 QStringLiteral("\"say \"\"x\"\"\""));
    }

    // ── Reading ──────────────────────────────────────────────────
    void read_aliasesAndRelativePaths()
    {
        const QString csv = m_dir.filePath("aliases.csv");
        QByteArray content =
            "\xEF\xBB\xBF"
            "Title,Artist,BPM,Key,Location,Year\r\n"
            "Alpha,Someone,124.5,Am,music/a.mp3,2019\r\n"
            ",,,,\"" + m_dir.filePath("music/c.flac").toUtf8() + "\",\r\n";
        QVERIFY(TestAudio::touch(csv, content));

        ImportResult r = CsvCodec::read(csv);
        QVERIFY(r.ok);
        QCOMPARE(r.document.tracks.size(), 2);

        const Track& a = r.document.tracks[0];
        QCOMPARE(a.title, QStringLiteral("Alpha"));
        QCOMPARE(a.artist, QStringLiteral("Someone"));
        QCOMPARE(a.bpm, 124.5);
        QCOMPARE(a.key, QStringLiteral("Am"));
        QCOMPARE(a.year, QStringLiteral("2019"));
        QCOMPARE(a.filePath, QDir::cleanPath(m_dir.filePath("music/a.mp3")));
        QVERIFY(!a.id.isEmpty());

        const Track& c = r.document.tracks[1];
        QCOMPARE(c.title, QStringLiteral("c"));
        QCOMPARE(c.artist, unknownArtist());
        QCOMPARE(c.key, QStringLiteral("Unknown"));
        QCOMPARE(c.bpm, 0.0);
        QVERIFY(a.id != c.id);
    }

    void read_skipsRowsWithoutPathOrFile()
    {
        const QString csv = m_dir.filePath("skips.csv");
        QByteArray content =
            "name,path\n"
            "No Path,\n"
            "Missing," + m_dir.filePath("music/gone.mp3").toUtf8() + "\n"
            "Here,music/a.mp3\n"
            "Again,music/a.mp3\n";
        QVERIFY(TestAudio::touch(csv, content));

        ImportResult r = CsvCodec::read(csv);
        QVERIFY(r.ok);
        QCOMPARE(r.document.tracks.size(), 1);
        QCOMPARE(r.skipped.size(), 3);
        QCOMPARE(r.skipped[0].entry, QStringLiteral("row 2"));
        QCOMPARE(r.skipped[0].reason, QStringLiteral("No path"));
        QVERIFY(r.skipped[1].reason.startsWith(QStringLiteral("File does not exist")));
        QVERIFY(r.skipped[2].reason.startsWith(QStringLiteral("Duplicate path")));
    }

    void read_keepMissingFlagsCorrupt()
    {
        const QString csv = m_dir.filePath("keep.csv");
        QVERIFY(TestAudio::touch(csv, "path\nmusic/gone.mp3\n"));

        ReadOptions keep;
        keep.skipMissingFiles = false;
        ImportResult r = CsvCodec::read(csv, keep);
        QCOMPARE(r.document.tracks.size(), 1);
        QVERIFY(r.document.tracks[0].isCorrupt);
    }

    void read_emptyFileFails()
    {
        const QString csv = m_dir.filePath("empty.csv");
        QVERIFY(TestAudio::touch(csv));
        QVERIFY(!CsvCodec::read(csv).ok);
        QVERIFY(!CsvCodec::read(m_dir.filePath("absent.csv")).ok);
    }

    // ── Writing ──────────────────────────────────────────────────
    void write_thenReadBack()
    {
        LibraryDocument doc;
        Track t = Track::defaults(m_dir.filePath("music/b, the \"remix\".wav"));
        t.id = QStringLiteral("t1");
        t.title = QStringLiteral("B, the \"remix\"");
        t.bpm = 126.0;
        t.key = QStringLiteral("D#");
        doc.tracks = {t};
        doc.playlists = {{QStringLiteral("ignored"), {QStringLiteral("t1")}}};

        const QString out = m_dir.filePath("out.csv");
        ExportResult w = CsvCodec::write(out, doc);
        QVERIFY2(w.ok, qPrintable(w.errorMessage));
        QCOMPARE(w.tracksWritten, 1);
        QCOMPARE(w.playlistsWritten, 0);
        QCOMPARE(w.identities.value("t1"), t.filePath);

        QFile f(out);
        QVERIFY(f.open(QIODevice::ReadOnly));
        const QByteArray raw = f.readAll();
        QVERIFY(raw.startsWith("name,artist,album,genre,bpm,key,path\r\n"));
        f.close();

        ImportResult r = CsvCodec::read(out);
        QVERIFY(r.ok);
        QCOMPARE(r.document.tracks.size(), 1);
        QCOMPARE(r.document.tracks[0].title, t.title);
        QCOMPARE(r.document.tracks[0].filePath, t.filePath);
        QCOMPARE(r.document.tracks[0].bpm, 126.0);
        QCOMPARE(r.document.tracks[0].key, QStringLiteral("D#"));
        QVERIFY(r.document.playlists.isEmpty());
    }

private:
    QTemporaryDir m_dir;
};

QTEST_MAIN(tst_CsvCodec)
#include "tst_CsvCodec.moc"
