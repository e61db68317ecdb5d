#include "NmlToRekordboxConverter.h"
#include "../formats/NmlCodec.h"
#include "../formats/RekordboxXmlCodec.h"

#include <QDebug>

int NmlToRekordboxConverter::remapCues(LibraryDocument& document, const CueMappingOptions& options)
{
    int cuesOut = 0;
    for (Track& t : document.tracks) {
        t.cuePoints = CueMapper::toRekordbox(t.cuePoints, options);
        cuesOut += t.cuePoints.size();
    }
    return cuesOut;
}

ConversionReport NmlToRekordboxConverter::convert(const QString& nmlPath, const QString& xmlPath,
                                                  const CueMappingOptions& options)
{
    ConversionReport report;

    ReadOptions readOptions;
    readOptions.skipMissingFiles = false;
    ImportResult source = NmlCodec::read(nmlPath, readOptions);
    report.skipped = source.skipped;
    if (!source.ok) {
        report.errorMessage = source.errorMessage;
        return report;
    }

    LibraryDocument& doc = source.document;
    for (const Track& t : doc.tracks)
        report.cuesIn += t.cuePoints.size();
    report.cuesOut = remapCues(doc, options);

    ExportResult written = RekordboxXmlCodec::write(xmlPath, doc);
    if (!written.ok) {
        report.errorMessage = written.errorMessage;
        return report;
    }

    report.ok = true;
    report.tracksConverted = written.tracksWritten;
    report.droppedReferences = written.droppedReferences;
    report.identities = written.identities;
    qDebug() << "[Convert] NML -> rekordbox:" << report.tracksConverted << "tracks, cues"
             << report.cuesIn << "->" << report.cuesOut;
    return report;
}
