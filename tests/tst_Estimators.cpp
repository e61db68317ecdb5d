#include <QtTest/QtTest>
#include "TestAudio.h"
#include "TempoEstimator.h"
#include "KeyEstimator.h"
#include "EnergyAnalyzer.h"

static constexpr int kRate = 22050;

class tst_Estimators : public QObject {
    Q_OBJECT

private slots:
    // ── Tempo ────────────────────────────────────────────────────
    void tempo_clickTrack120()
    {
        TempoResult r = TempoEstimator::estimate(TestAudio::clicks(120.0, 20.0, kRate), kRate);
        QVERIFY(r.valid);
        QVERIFY2(std::abs(r.bpm - 120.0) <= 2.0, qPrintable(QString::number(r.bpm)));
        QVERIFY(r.confidence > 0.0);
    }

    void tempo_clickTrack100()
    {
        TempoResult r = TempoEstimator::estimate(TestAudio::clicks(100.0, 20.0, kRate), kRate);
        QVERIFY(r.valid);
        QVERIFY2(std::abs(r.bpm - 100.0) <= 2.0, qPrintable(QString::number(r.bpm)));
    }

    void tempo_resultRoundedToTenth()
    {
        TempoResult r = TempoEstimator::estimate(TestAudio::clicks(128.0, 15.0, kRate), kRate);
        QVERIFY(r.valid);
        QCOMPARE(std::round(r.bpm * 10.0) / 10.0, r.bpm);
        QVERIFY(r.bpm >= TempoEstimator::kMinBpm && r.bpm <= TempoEstimator::kMaxBpm);
    }

    void tempo_silenceIsInvalid()
    {
        std::vector<float> silence(size_t(10 * kRate), 0.0f);
        QVERIFY(!TempoEstimator::estimate(silence, kRate).valid);
    }

    void tempo_shortExcerptIsInvalid()
    {
        QVERIFY(!TempoEstimator::estimate(TestAudio::clicks(120.0, 1.0, kRate), kRate).valid);
        QVERIFY(!TempoEstimator::estimate({}, kRate).valid);
    }

    void onsetEnvelope_peaksOnClicks()
    {
        std::vector<double> onset =
            TempoEstimator::onsetEnvelope(TestAudio::clicks(120.0, 2.0, kRate), 1024, 256);
        QVERIFY(!onset.empty());
        for (double v : onset)
            QVERIFY(v >= 0.0);  // half-wave rectified
    }

    // ── Key ──────────────────────────────────────────────────────
    void key_aMajorTriad()
    {
        auto triad = TestAudio::mix({
            TestAudio::sine(440.00, 5.0, kRate, 0.3f),  // A
            TestAudio::sine(554.37, 5.0, kRate, 0.3f),  // C#
            TestAudio::sine(659.26, 5.0, kRate, 0.3f),  // E
        });
        KeyResult r = KeyEstimator::estimate(triad, kRate);
        QVERIFY(r.valid);
        QCOMPARE(r.name(), QStringLiteral("A"));
        QVERIFY(!r.minor);
    }

    void key_cMajorTriad()
    {
        auto triad = TestAudio::mix({
            TestAudio::sine(261.63, 5.0, kRate, 0.3f),  // C
            TestAudio::sine(329.63, 5.0, kRate, 0.3f),  // E
            TestAudio::sine(392.00, 5.0, kRate, 0.3f),  // G
        });
        KeyResult r = KeyEstimator::estimate(triad, kRate);
        QVERIFY(r.valid);
        QCOMPARE(r.name(), QStringLiteral("C"));
    }

    void key_silenceIsUnknown()
    {
        std::vector<float> silence(size_t(3 * kRate), 0.0f);
        KeyResult r = KeyEstimator::estimate(silence, kRate);
        QVERIFY(!r.valid);
        QCOMPARE(r.name(), QStringLiteral("Unknown"));
    }

    void chroma_concentratesOnPlayedNote()
    {
        auto chroma = KeyEstimator::chroma(TestAudio::sine(440.0, 2.0, kRate, 0.5f), kRate);
        int best = 0;
        for (int i = 1; i < 12; ++i) {
            if (chroma[size_t(i)] > chroma[size_t(best)]) best = i;
        }
        QCOMPARE(best, 9);  // A
    }

    // ── Energy ───────────────────────────────────────────────────
    void energy_sineAmplitude()
    {
        // RMS of a 0.5 sine is 0.354
        EnergyResult r = EnergyAnalyzer::analyze(TestAudio::sine(440.0, 3.0, kRate, 0.5f));
        QVERIFY(r.valid);
        QVERIFY2(std::abs(r.energy - 35) <= 1, qPrintable(QString::number(r.energy)));
    }

    void energy_silenceIsZero()
    {
        EnergyResult r = EnergyAnalyzer::analyze(std::vector<float>(size_t(kRate), 0.0f));
        QVERIFY(r.valid);
        QCOMPARE(r.energy, 0);
    }

    void energy_clampedAt100()
    {
        EnergyResult r = EnergyAnalyzer::analyze(std::vector<float>(size_t(kRate), 1.5f));
        QCOMPARE(r.energy, 100);
    }

    void energy_shortExcerptIsOneFrame()
    {
        EnergyResult r = EnergyAnalyzer::analyze(std::vector<float>(500, 0.2f));
        QVERIFY(r.valid);
        QCOMPARE(r.energy, 20);
    }

    void energy_emptyIsInvalid()
    {
        QVERIFY(!EnergyAnalyzer::analyze({}).valid);
    }
};

QTEST_MAIN(tst_Estimators)
#include "tst_Estimators.moc"
