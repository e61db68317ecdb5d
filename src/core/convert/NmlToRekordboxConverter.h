#pragma once

#include "ConversionReport.h"
#include "CueMapper.h"

// Traktor NML collection -> rekordbox XML
class NmlToRekordboxConverter {
public:
    static ConversionReport convert(const QString& nmlPath, const QString& xmlPath,
                                    const CueMappingOptions& options = CueMappingOptions());

    // In-memory half, shared with the migration pipeline
    static int remapCues(LibraryDocument& document, const CueMappingOptions& options);
};
