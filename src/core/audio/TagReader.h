#pragma once

#include <QString>

// Fields read from the embedded tags of one audio file
struct TagData {
    bool    valid = false;      // false when the container could not be parsed
    QString errorMessage;

    QString title;
    QString artist;
    QString album;
    QString genre;
    QString year;
    QString comment;

    double  bpm = 0.0;          // 0 = no BPM tag
    QString key;                // raw tag value, empty when absent
    double  duration = 0.0;     // seconds from the container header
};

// One TagLib reader per container, chosen by file extension:
// flac, mp3, m4a/aac, wav, anything else through FileRef.
class TagReader {
public:
    static TagData read(const QString& filePath);

private:
    static TagData readFlac(const QString& filePath);
    static TagData readMpeg(const QString& filePath);
    static TagData readMp4(const QString& filePath);
    static TagData readWav(const QString& filePath);
    static TagData readGeneric(const QString& filePath);
};
