#include <QtTest/QtTest>
#include "MusicData.h"

static Track makeTrack(const QString& title, const QString& genre, double bpm,
                       const QString& key = QStringLiteral("Unknown"))
{
    Track t = Track::defaults(QStringLiteral("/music/%1.mp3").arg(title));
    t.id = title;
    t.genre = genre;
    t.bpm = bpm;
    t.key = key;
    return t;
}

class tst_MusicData : public QObject {
    Q_OBJECT

private slots:
    // ── Key normalization ────────────────────────────────────────
    void normalizeKey_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<QString>("expected");

        QTest::newRow("natural")      << "C"        << "C";
        QTest::newRow("minor suffix") << "Am"       << "A";
        QTest::newRow("sharp")        << "F#"       << "F#";
        QTest::newRow("flat")         << "Bb"       << "A#";
        QTest::newRow("flat minor")   << "Ebm"      << "D#";
        QTest::newRow("long mode")    << "F# minor" << "F#";
        QTest::newRow("lower case")   << "g"        << "G";
        QTest::newRow("whitespace")   << "  D  "    << "D";
        QTest::newRow("C flat wraps") << "Cb"       << "B";
    }

    void normalizeKey()
    {
        QFETCH(QString, input);
        QFETCH(QString, expected);
        auto key = ::normalizeKey(input);
        QVERIFY(key.has_value());
        QCOMPARE(*key, expected);
    }

    void normalizeKey_rejectsNonsense()
    {
        QVERIFY(!::normalizeKey(QString()).has_value());
        QVERIFY(!::normalizeKey(QStringLiteral("H")).has_value());
        QVERIFY(!::normalizeKey(QStringLiteral("8A")).has_value());
        QVERIFY(!::normalizeKey(QStringLiteral("Cx7")).has_value());
    }

    void pitchClassNames_twelveEntries()
    {
        QCOMPARE(kPitchClassNames.size(), 12);
        QCOMPARE(kPitchClassNames.first(), QStringLiteral("C"));
        QCOMPARE(kPitchClassNames.last(), QStringLiteral("B"));
    }

    // ── Track defaults ───────────────────────────────────────────
    void defaults_fillsPlaceholders()
    {
        Track t = Track::defaults(QStringLiteral("/music/Artist - Song.final.mp3"));
        QCOMPARE(t.title, QStringLiteral("Artist - Song.final"));
        QCOMPARE(t.artist, unknownArtist());
        QCOMPARE(t.album, unknownAlbum());
        QCOMPARE(t.genre, unknownGenre());
        QCOMPARE(t.key, QStringLiteral("Unknown"));
        QCOMPARE(t.bpm, 0.0);
        QCOMPARE(t.energy, 0);
        QVERIFY(!t.isCorrupt);
        QVERIFY(t.cuePoints.isEmpty());
    }

    void applyDefaults_keepsPresentValues()
    {
        Track t;
        t.filePath = QStringLiteral("/music/track.flac");
        t.artist = QStringLiteral("Someone");
        t.energy = 140;
        t.bpm = -3.0;
        t.key = QString();
        t.applyDefaults();

        QCOMPARE(t.title, QStringLiteral("track"));
        QCOMPARE(t.artist, QStringLiteral("Someone"));
        QCOMPARE(t.album, unknownAlbum());
        QCOMPARE(t.key, QStringLiteral("Unknown"));
        QCOMPARE(t.bpm, 0.0);
        QCOMPARE(t.energy, 100);  // clamped
    }

    void isPlayable_requiresPathAndHealth()
    {
        Track t = Track::defaults(QStringLiteral("/music/a.mp3"));
        QVERIFY(t.isPlayable());
        t.isCorrupt = true;
        QVERIFY(!t.isPlayable());
        QVERIFY(!Track().isPlayable());
    }

    void toRecord_exposesEveryField()
    {
        Track t = makeTrack(QStringLiteral("one"), QStringLiteral("Techno"), 128.0,
                            QStringLiteral("A"));
        t.cuePoints.append({CueType::Loop, 12.5, QStringLiteral("Drop"), -1});

        QVariantMap r = t.toRecord();
        QCOMPARE(r.value("title").toString(), QStringLiteral("one"));
        QCOMPARE(r.value("genre").toString(), QStringLiteral("Techno"));
        QCOMPARE(r.value("bpm").toDouble(), 128.0);
        QCOMPARE(r.value("key").toString(), QStringLiteral("A"));
        QCOMPARE(r.value("is_corrupt").toBool(), false);

        QVariantList cues = r.value("cue_points").toList();
        QCOMPARE(cues.size(), 1);
        QVariantMap cue = cues.first().toMap();
        QCOMPARE(cue.value("type").toString(), QStringLiteral("loop"));
        QCOMPARE(cue.value("start").toDouble(), 12.5);
        QCOMPARE(cue.value("label").toString(), QStringLiteral("Drop"));
    }

    // ── Filtering ────────────────────────────────────────────────
    void filterTracks_combinesCriteria()
    {
        QVector<Track> tracks = {
            makeTrack("a", "Techno", 125.0, "A"),
            makeTrack("b", "techno", 132.0, "C"),
            makeTrack("c", "House", 124.0, "A"),
            makeTrack("d", "Techno", 0.0),
        };

        TrackFilter byGenre;
        byGenre.genre = QStringLiteral("TECHNO");
        QCOMPARE(filterTracks(tracks, byGenre).size(), 3);

        TrackFilter byRange;
        byRange.bpmMin = 124.0;
        byRange.bpmMax = 130.0;
        QVector<Track> ranged = filterTracks(tracks, byRange);
        QCOMPARE(ranged.size(), 2);
        QCOMPARE(ranged.at(0).id, QStringLiteral("a"));
        QCOMPARE(ranged.at(1).id, QStringLiteral("c"));

        TrackFilter combined = byRange;
        combined.genre = QStringLiteral("techno");
        combined.key = QStringLiteral("A");
        QVector<Track> one = filterTracks(tracks, combined);
        QCOMPARE(one.size(), 1);
        QCOMPARE(one.first().id, QStringLiteral("a"));
    }

    void filterTracks_emptyFilterKeepsAll()
    {
        QVector<Track> tracks = { makeTrack("a", "x", 1.0), makeTrack("b", "y", 2.0) };
        QCOMPARE(filterTracks(tracks, TrackFilter()).size(), 2);
    }

    void removeCorrupt_dropsFlagged()
    {
        QVector<Track> tracks = { makeTrack("a", "x", 1.0), makeTrack("b", "y", 2.0) };
        tracks[0].isCorrupt = true;
        QVector<Track> healthy = removeCorrupt(tracks);
        QCOMPARE(healthy.size(), 1);
        QCOMPARE(healthy.first().id, QStringLiteral("b"));
    }

    // ── Formats ──────────────────────────────────────────────────
    void formatFromExtension_mapsKnownSuffixes()
    {
        QVERIFY(formatFromExtension("/x/collection.nml") == LibraryFormat::Nml);
        QVERIFY(formatFromExtension("/x/rekordbox.XML") == LibraryFormat::RekordboxXml);
        QVERIFY(formatFromExtension("/x/list.csv") == LibraryFormat::Csv);
        QVERIFY(formatFromExtension("/x/set.m3u8") == LibraryFormat::M3u);
        QVERIFY(!formatFromExtension("/x/notes.txt").has_value());
    }

    void formatFromName_acceptsAliases()
    {
        QVERIFY(formatFromName("traktor") == LibraryFormat::Nml);
        QVERIFY(formatFromName(" Rekordbox ") == LibraryFormat::RekordboxXml);
        QVERIFY(!formatFromName("serato").has_value());
    }

    void formatDuration_roundsToSeconds()
    {
        QCOMPARE(formatDuration(0.0), QStringLiteral("0:00"));
        QCOMPARE(formatDuration(65.4), QStringLiteral("1:05"));
        QCOMPARE(formatDuration(359.6), QStringLiteral("6:00"));
    }

    void indexOfTrack_findsById()
    {
        LibraryDocument doc;
        doc.tracks = { makeTrack("a", "x", 1.0), makeTrack("b", "y", 2.0) };
        QCOMPARE(doc.indexOfTrack("b"), 1);
        QCOMPARE(doc.indexOfTrack("zzz"), -1);
    }
};

QTEST_MAIN(tst_MusicData)
#include "tst_MusicData.moc"
