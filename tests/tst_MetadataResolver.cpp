#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "TestAudio.h"
#include "MetadataResolver.h"

static constexpr int kRate = 22050;

// Tags only, no decoding
static AnalysisConfig tagsOnly()
{
    AnalysisConfig c;
    c.enabled = false;
    return c;
}

class tst_MetadataResolver : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
    }

    // ── Corruption signals ───────────────────────────────────────
    void resolve_missingFile()
    {
        MetadataResolver resolver;
        QString path = m_dir.filePath(QStringLiteral("Nobody - Ghost.mp3"));
        Track t = resolver.resolve(path);

        QVERIFY(t.isCorrupt);
        QCOMPARE(t.errorMessage, QStringLiteral("File does not exist"));
        QCOMPARE(t.title, QStringLiteral("Nobody - Ghost"));
        QCOMPARE(t.artist, unknownArtist());
        QCOMPARE(t.bpm, 0.0);
        QCOMPARE(t.key, QStringLiteral("Unknown"));
        QCOMPARE(t.filePath, path);
        QVERIFY(!t.id.isEmpty());
    }

    void resolve_tooSmall()
    {
        QString path = m_dir.filePath(QStringLiteral("tiny.mp3"));
        QVERIFY(TestAudio::touch(path, QByteArray(100, 'a')));

        Track t = MetadataResolver().resolve(path);
        QVERIFY(t.isCorrupt);
        QCOMPARE(t.errorMessage, QStringLiteral("File too small (100 bytes)"));
    }

    void resolve_garbageMp3()
    {
        QString path = m_dir.filePath(QStringLiteral("garbage.mp3"));
        QVERIFY(TestAudio::writeGarbage(path, 4096));

        Track t = MetadataResolver(tagsOnly()).resolve(path);
        QVERIFY(t.isCorrupt);
        QCOMPARE(t.errorMessage, QStringLiteral("Invalid MP3 file"));
        QCOMPARE(t.title, QStringLiteral("garbage"));
    }

    void resolve_garbageWav()
    {
        QString path = m_dir.filePath(QStringLiteral("garbage.wav"));
        QVERIFY(TestAudio::writeGarbage(path, 4096));

        Track t = MetadataResolver(tagsOnly()).resolve(path);
        QVERIFY(t.isCorrupt);
        QCOMPARE(t.errorMessage, QStringLiteral("Invalid WAV file"));
    }

    // ── Tags ─────────────────────────────────────────────────────
    void resolve_untaggedWavGetsPlaceholders()
    {
        QString path = m_dir.filePath(QStringLiteral("plain.wav"));
        QVERIFY(TestAudio::writeWav(path, TestAudio::sine(440.0, 2.0, kRate, 0.5f), kRate));

        Track t = MetadataResolver(tagsOnly()).resolve(path);
        QVERIFY(!t.isCorrupt);
        QCOMPARE(t.title, QStringLiteral("plain"));
        QCOMPARE(t.artist, unknownArtist());
        QCOMPARE(t.genre, unknownGenre());
        QCOMPARE(t.bpm, 0.0);
        QCOMPARE(t.key, QStringLiteral("Unknown"));
        QVERIFY(std::abs(t.duration - 2.0) < 0.05);
    }

    void resolve_tagBpmTakesPrecedence()
    {
        // Clicks at 120 but the tag says 128
        QString path = m_dir.filePath(QStringLiteral("tagged.wav"));
        QVERIFY(TestAudio::writeWav(path, TestAudio::clicks(120.0, 12.0, kRate), kRate));
        QVERIFY(TestAudio::tagWavBpm(path, QStringLiteral("128")));

        Track t = MetadataResolver().resolve(path);
        QVERIFY(!t.isCorrupt);
        QCOMPARE(t.bpm, 128.0);
    }

    // ── Analysis ─────────────────────────────────────────────────
    void resolve_estimatesBpmWhenUntagged()
    {
        QString path = m_dir.filePath(QStringLiteral("clicks.wav"));
        QVERIFY(TestAudio::writeWav(path, TestAudio::clicks(120.0, 40.0, kRate), kRate));

        Track t = MetadataResolver().resolve(path);
        QVERIFY(!t.isCorrupt);
        QVERIFY2(std::abs(t.bpm - 120.0) <= 2.0, qPrintable(QString::number(t.bpm)));
        QVERIFY(t.energy > 0);
    }

    void resolve_estimatesKeyAndEnergy()
    {
        QString path = m_dir.filePath(QStringLiteral("chord.wav"));
        auto chord = TestAudio::mix({
            TestAudio::sine(440.00, 8.0, kRate, 0.3f),
            TestAudio::sine(554.37, 8.0, kRate, 0.3f),
            TestAudio::sine(659.26, 8.0, kRate, 0.3f),
        });
        QVERIFY(TestAudio::writeWav(path, chord, kRate));

        // File shorter than every window: windows slide back to the start
        Track t = MetadataResolver().resolve(path);
        QVERIFY(!t.isCorrupt);
        QCOMPARE(t.key, QStringLiteral("A"));
        QVERIFY(t.energy > 0 && t.energy <= 100);
    }

    void resolve_analysisDisabledLeavesUnknowns()
    {
        QString path = m_dir.filePath(QStringLiteral("quiet.wav"));
        QVERIFY(TestAudio::writeWav(path, TestAudio::clicks(120.0, 10.0, kRate), kRate));

        Track t = MetadataResolver(tagsOnly()).resolve(path);
        QCOMPARE(t.bpm, 0.0);
        QCOMPARE(t.key, QStringLiteral("Unknown"));
        QCOMPARE(t.energy, 0);
    }

    // ── Configuration ────────────────────────────────────────────
    void supportedExtensions()
    {
        QVERIFY(MetadataResolver::isSupportedFile(QStringLiteral("/a/b.MP3")));
        QVERIFY(MetadataResolver::isSupportedFile(QStringLiteral("/a/b.flac")));
        QVERIFY(MetadataResolver::isSupportedFile(QStringLiteral("/a/b.m4a")));
        QVERIFY(!MetadataResolver::isSupportedFile(QStringLiteral("/a/b.ogg")));
        QVERIFY(!MetadataResolver::isSupportedFile(QStringLiteral("/a/b")));
    }

    void resolve_freshIdPerCall()
    {
        QString path = m_dir.filePath(QStringLiteral("missing.flac"));
        MetadataResolver resolver;
        QVERIFY(resolver.resolve(path).id != resolver.resolve(path).id);
    }

private:
    QTemporaryDir m_dir;
};

QTEST_MAIN(tst_MetadataResolver)
#include "tst_MetadataResolver.moc"
