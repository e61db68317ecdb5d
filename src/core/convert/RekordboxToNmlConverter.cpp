#include "RekordboxToNmlConverter.h"
#include "../formats/NmlCodec.h"
#include "../formats/RekordboxXmlCodec.h"

#include <QDebug>

int RekordboxToNmlConverter::remapCues(LibraryDocument& document, const CueMappingOptions& options)
{
    int cuesOut = 0;
    for (Track& t : document.tracks) {
        t.cuePoints = CueMapper::toNml(t.cuePoints, options);
        cuesOut += t.cuePoints.size();
    }
    return cuesOut;
}

ConversionReport RekordboxToNmlConverter::convert(const QString& xmlPath, const QString& nmlPath,
                                                  const CueMappingOptions& options)
{
    ConversionReport report;

    ReadOptions readOptions;
    readOptions.skipMissingFiles = false;
    ImportResult source = RekordboxXmlCodec::read(xmlPath, readOptions);
    report.skipped = source.skipped;
    if (!source.ok) {
        report.errorMessage = source.errorMessage;
        return report;
    }

    LibraryDocument& doc = source.document;
    for (const Track& t : doc.tracks)
        report.cuesIn += t.cuePoints.size();
    report.cuesOut = remapCues(doc, options);

    ExportResult written = NmlCodec::write(nmlPath, doc);
    if (!written.ok) {
        report.errorMessage = written.errorMessage;
        return report;
    }

    report.ok = true;
    report.tracksConverted = written.tracksWritten;
    report.droppedReferences = written.droppedReferences;
    report.identities = written.identities;
    qDebug() << "[Convert] rekordbox -> NML:" << report.tracksConverted << "tracks, cues"
             << report.cuesIn << "->" << report.cuesOut;
    return report;
}
