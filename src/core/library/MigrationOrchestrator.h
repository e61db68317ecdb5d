#pragma once

#include "../CancellationToken.h"
#include "../MusicData.h"
#include "../ProgressReporter.h"
#include "../convert/CueMapper.h"
#include "../formats/LibraryCodec.h"

#include <QHash>
#include <QObject>
#include <QStringList>
#include <optional>

class Settings;

enum class CueRetention {
    All,
    First8,
    None
};

enum class MissingFilePolicy {
    Skip,
    IncludeWithWarning
};

std::optional<CueRetention> cueRetentionFromString(const QString& value);
std::optional<MissingFilePolicy> missingFilePolicyFromString(const QString& value);

struct MigrationOptions {
    CueRetention      cueRetention = CueRetention::All;
    MissingFilePolicy missingFiles = MissingFilePolicy::Skip;
    bool              locateMissing = false;
    QStringList       searchFolders;      // registration order matters
    CueMappingOptions cueMapping;

    static MigrationOptions fromSettings(const Settings* settings);
};

struct MigrationResult {
    bool ok = false;
    bool canceled = false;
    QString errorMessage;
    QVector<Track> tracks;
    QVector<SkipRecord> skipped;
    IdentityMap identities;
    int tracksWritten = 0;      // as reported by the target codec
    int relocated = 0;
    int missingIncluded = 0;
};

// Source codec -> missing-file policy -> cue retention -> target codec.
// The codecs never see each other.
class MigrationOrchestrator : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Reading,
        Processing,
        Writing,
        Done,
        Canceled,
        Failed
    };
    Q_ENUM(State)

    static constexpr int kMaxRetainedCues = 8;

    explicit MigrationOrchestrator(QObject* parent = nullptr);

    MigrationResult migrate(const QString& sourcePath, const QString& targetPath,
                            LibraryFormat sourceFormat, LibraryFormat targetFormat,
                            const MigrationOptions& options,
                            CancellationToken* token = nullptr,
                            const ProgressCallback& progress = ProgressCallback());

    State state() const { return m_state; }

    static void applyCueRetention(Track& track, CueRetention retention);

    // file name -> first match; folders in order, smallest path within a folder
    static QHash<QString, QString> buildLocateIndex(const QStringList& folders);

signals:
    void stateChanged(MigrationOrchestrator::State state);

private:
    void setState(State state);
    MigrationResult cancel(MigrationResult& result, ProgressReporter& reporter);

    State m_state = State::Idle;
};
