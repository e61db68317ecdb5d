#pragma once

#include "../formats/LibraryCodec.h"

struct ConversionReport {
    bool ok = false;
    QString errorMessage;
    int tracksConverted = 0;
    int cuesIn = 0;
    int cuesOut = 0;
    int droppedReferences = 0;
    IdentityMap identities;             // source id -> target id
    QVector<SkipRecord> skipped;        // entries the source reader rejected
};
