#pragma once

#include "ConversionReport.h"
#include "CueMapper.h"

// rekordbox XML -> Traktor NML collection
class RekordboxToNmlConverter {
public:
    static ConversionReport convert(const QString& xmlPath, const QString& nmlPath,
                                    const CueMappingOptions& options = CueMappingOptions());

    static int remapCues(LibraryDocument& document, const CueMappingOptions& options);
};
