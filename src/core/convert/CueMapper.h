#pragma once

#include "../MusicData.h"

#include <optional>

struct CueMappingOptions {
    // NML -> rekordbox: the first hot cue of a track also becomes a memory cue
    bool mapFirstHotCueToMemory = false;
    // rekordbox -> NML: memory cues become hot cues instead of being dropped
    bool mapMemoryToHotCue = false;
};

// Cue remapping between Traktor and rekordbox semantics. The two directions
// are not inverses: forward may add a memory cue, reverse may drop one.
class CueMapper {
public:
    // Positions closer than this are the same marker
    static constexpr double kSamePositionSecs = 0.0005;

    static QVector<CueMarker> toRekordbox(const QVector<CueMarker>& cues,
                                          const CueMappingOptions& options);
    static QVector<CueMarker> toNml(const QVector<CueMarker>& cues,
                                    const CueMappingOptions& options);

    // Last whitespace-separated integer of a cue label ("Cue 3" -> 3)
    static std::optional<int> labelNumber(const QString& label);
};
