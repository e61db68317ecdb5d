#include "CueMapper.h"

#include <QDebug>
#include <QSet>

#include <cmath>

std::optional<int> CueMapper::labelNumber(const QString& label)
{
    const QStringList tokens = label.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (auto it = tokens.crbegin(); it != tokens.crend(); ++it) {
        bool ok = false;
        int n = it->toInt(&ok);
        if (ok)
            return n;
    }
    return std::nullopt;
}

QVector<CueMarker> CueMapper::toRekordbox(const QVector<CueMarker>& cues,
                                          const CueMappingOptions& options)
{
    QVector<CueMarker> out;
    out.reserve(cues.size() + 1);

    int hotCueOrdinal = 0;
    bool firstHotCueSeen = false;

    for (const CueMarker& cue : cues) {
        switch (cue.type) {
        case CueType::HotCue: {
            const int n = labelNumber(cue.label).value_or(hotCueOrdinal);
            const int slot = cue.hotCueIndex >= 0 ? cue.hotCueIndex : hotCueOrdinal;
            ++hotCueOrdinal;

            if (options.mapFirstHotCueToMemory && !firstHotCueSeen) {
                CueMarker memory;
                memory.type = CueType::Memory;
                memory.startSecs = cue.startSecs;
                memory.label = QStringLiteral("Memory %1").arg(n + 1);
                out.append(memory);
            }
            firstHotCueSeen = true;

            CueMarker hot = cue;
            hot.label = QStringLiteral("Hot Cue %1").arg(n + 1);
            hot.hotCueIndex = slot;
            out.append(hot);
            break;
        }
        case CueType::Loop:
            out.append(cue);
            break;
        case CueType::Grid:
        case CueType::Beat: {
            CueMarker grid = cue;
            grid.type = CueType::Grid;
            grid.label = QStringLiteral("Grid");
            grid.hotCueIndex = -1;
            out.append(grid);
            break;
        }
        case CueType::Memory:
            out.append(cue);
            break;
        }
    }
    return out;
}

QVector<CueMarker> CueMapper::toNml(const QVector<CueMarker>& cues,
                                    const CueMappingOptions& options)
{
    QVector<double> hotCuePositions;
    QSet<int> usedSlots;
    for (const CueMarker& cue : cues) {
        if (cue.type != CueType::HotCue) continue;
        hotCuePositions.append(cue.startSecs);
        if (cue.hotCueIndex >= 0) usedSlots.insert(cue.hotCueIndex);
    }

    auto hasHotCueAt = [&](double secs) {
        for (double p : hotCuePositions) {
            if (std::abs(p - secs) <= kSamePositionSecs)
                return true;
        }
        return false;
    };

    QVector<CueMarker> out;
    out.reserve(cues.size());
    int ordinal = 0;

    for (const CueMarker& cue : cues) {
        switch (cue.type) {
        case CueType::HotCue:
        case CueType::Loop:
        case CueType::Grid:
        case CueType::Beat:
            out.append(cue);
            if (cue.type == CueType::HotCue) ++ordinal;
            break;
        case CueType::Memory: {
            // The twin of a hot cue, induced by the forward mapping
            if (hasHotCueAt(cue.startSecs)) {
                if (options.mapMemoryToHotCue)
                    qWarning() << "[CueMapper] Dropping memory cue" << cue.label
                               << "at" << cue.startSecs << "- a hot cue sits at the same position";
                else
                    qDebug() << "[CueMapper] Dropping memory cue twin at" << cue.startSecs;
                break;
            }
            if (!options.mapMemoryToHotCue) {
                qDebug() << "[CueMapper] Dropping memory cue" << cue.label;
                break;
            }

            int slot = 0;
            while (usedSlots.contains(slot)) ++slot;
            usedSlots.insert(slot);

            CueMarker hot;
            hot.type = CueType::HotCue;
            hot.startSecs = cue.startSecs;
            hot.label = QStringLiteral("Hot Cue %1").arg(labelNumber(cue.label).value_or(ordinal));
            hot.hotCueIndex = slot;
            hotCuePositions.append(cue.startSecs);
            out.append(hot);
            ++ordinal;
            break;
        }
        }
    }
    return out;
}
