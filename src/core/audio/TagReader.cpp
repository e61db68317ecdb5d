#include "TagReader.h"

#include <QDebug>
#include <QFileInfo>

#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tpropertymap.h>
#include <taglib/mpegfile.h>
#include <taglib/flacfile.h>
#include <taglib/mp4file.h>
#include <taglib/mp4tag.h>
#include <taglib/wavfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/xiphcomment.h>

static QString toQString(const TagLib::String& s)
{
    return QString::fromStdString(s.to8Bit(true)).trimmed();
}

static double parseBpm(const QString& value)
{
    // "128", "127.98", "128 BPM"
    QString v = value.trimmed();
    int space = v.indexOf(QLatin1Char(' '));
    if (space > 0) v = v.left(space);
    bool ok = false;
    double bpm = v.toDouble(&ok);
    return (ok && bpm > 0.0) ? bpm : 0.0;
}

// Common fields every TagLib::Tag exposes
static void fillBasic(TagData& data, const TagLib::Tag* tag)
{
    if (!tag) return;
    data.title   = toQString(tag->title());
    data.artist  = toQString(tag->artist());
    data.album   = toQString(tag->album());
    data.genre   = toQString(tag->genre());
    data.comment = toQString(tag->comment());
    if (tag->year() > 0)
        data.year = QString::number(tag->year());
}

// A container header without a sample rate carries no decodable stream
static bool hasAudioStream(const TagLib::AudioProperties* props)
{
    return props && props->sampleRate() > 0;
}

static void fillDuration(TagData& data, const TagLib::AudioProperties* props)
{
    if (props)
        data.duration = props->lengthInMilliseconds() / 1000.0;
}

// BPM / INITIALKEY through the unified property map
static void fillFromProperties(TagData& data, const TagLib::PropertyMap& props)
{
    if (data.bpm <= 0.0 && props.contains("BPM") && !props["BPM"].isEmpty())
        data.bpm = parseBpm(toQString(props["BPM"].front()));
    if (data.key.isEmpty()) {
        for (const char* name : {"INITIALKEY", "KEY"}) {
            if (props.contains(name) && !props[name].isEmpty()) {
                data.key = toQString(props[name].front());
                break;
            }
        }
    }
}

// TBPM / TKEY frames
static void fillFromId3v2(TagData& data, TagLib::ID3v2::Tag* tag)
{
    if (!tag) return;
    const TagLib::ID3v2::FrameListMap& frames = tag->frameListMap();
    if (frames.contains("TBPM") && !frames["TBPM"].isEmpty())
        data.bpm = parseBpm(toQString(frames["TBPM"].front()->toString()));
    if (frames.contains("TKEY") && !frames["TKEY"].isEmpty())
        data.key = toQString(frames["TKEY"].front()->toString());
}

TagData TagReader::read(const QString& filePath)
{
    QString ext = QFileInfo(filePath).suffix().toLower();
    if (ext == QLatin1String("flac"))
        return readFlac(filePath);
    if (ext == QLatin1String("mp3"))
        return readMpeg(filePath);
    if (ext == QLatin1String("m4a") || ext == QLatin1String("aac"))
        return readMp4(filePath);
    if (ext == QLatin1String("wav"))
        return readWav(filePath);
    return readGeneric(filePath);
}

// ── FLAC (Xiph comment) ─────────────────────────────────────────────
TagData TagReader::readFlac(const QString& filePath)
{
    TagData data;
    TagLib::FLAC::File f(filePath.toUtf8().constData());
    if (!f.isValid() || !hasAudioStream(f.audioProperties())) {
        data.errorMessage = QStringLiteral("Invalid FLAC file");
        return data;
    }
    data.valid = true;
    fillBasic(data, f.tag());
    fillDuration(data, f.audioProperties());

    if (TagLib::Ogg::XiphComment* xiph = f.xiphComment()) {
        const TagLib::Ogg::FieldListMap& fields = xiph->fieldListMap();
        if (fields.contains("BPM") && !fields["BPM"].isEmpty())
            data.bpm = parseBpm(toQString(fields["BPM"].front()));
        for (const char* name : {"INITIALKEY", "KEY"}) {
            if (fields.contains(name) && !fields[name].isEmpty()) {
                data.key = toQString(fields[name].front());
                break;
            }
        }
    }
    fillFromProperties(data, f.properties());
    return data;
}

// ── MP3 (ID3v2 TBPM / TKEY) ─────────────────────────────────────────
TagData TagReader::readMpeg(const QString& filePath)
{
    TagData data;
    TagLib::MPEG::File f(filePath.toUtf8().constData());
    if (!f.isValid() || !hasAudioStream(f.audioProperties())) {
        data.errorMessage = QStringLiteral("Invalid MP3 file");
        return data;
    }
    data.valid = true;
    fillBasic(data, f.tag());
    fillDuration(data, f.audioProperties());

    if (f.hasID3v2Tag())
        fillFromId3v2(data, f.ID3v2Tag());
    fillFromProperties(data, f.properties());
    return data;
}

// ── MP4 / AAC (tmpo, iTunes initialkey) ─────────────────────────────
TagData TagReader::readMp4(const QString& filePath)
{
    TagData data;
    TagLib::MP4::File f(filePath.toUtf8().constData());
    if (!f.isValid() || !hasAudioStream(f.audioProperties())) {
        data.errorMessage = QStringLiteral("Invalid MP4/AAC file");
        return data;
    }
    data.valid = true;
    fillBasic(data, f.tag());
    fillDuration(data, f.audioProperties());

    if (TagLib::MP4::Tag* tag = f.tag()) {
        if (tag->contains("tmpo")) {
            int tmpo = tag->item("tmpo").toInt();
            if (tmpo > 0) data.bpm = tmpo;
        }
        const TagLib::String keyAtom("----:com.apple.iTunes:initialkey");
        if (tag->contains(keyAtom)) {
            TagLib::StringList values = tag->item(keyAtom).toStringList();
            if (!values.isEmpty())
                data.key = toQString(values.front());
        }
    }
    fillFromProperties(data, f.properties());
    return data;
}

// ── WAV (ID3v2 chunk) ───────────────────────────────────────────────
TagData TagReader::readWav(const QString& filePath)
{
    TagData data;
    TagLib::RIFF::WAV::File f(filePath.toUtf8().constData());
    if (!f.isValid() || !hasAudioStream(f.audioProperties())) {
        data.errorMessage = QStringLiteral("Invalid WAV file");
        return data;
    }
    data.valid = true;
    fillBasic(data, f.tag());
    fillDuration(data, f.audioProperties());

    if (f.hasID3v2Tag())
        fillFromId3v2(data, f.ID3v2Tag());
    return data;
}

// ── Anything else ──────────────────────────────────────────────────
TagData TagReader::readGeneric(const QString& filePath)
{
    TagData data;
    TagLib::FileRef f(filePath.toUtf8().constData());
    if (f.isNull() || !f.file() || !f.file()->isValid()
        || !hasAudioStream(f.audioProperties())) {
        data.errorMessage = QStringLiteral("Unable to read file format");
        return data;
    }
    data.valid = true;
    fillBasic(data, f.tag());
    fillDuration(data, f.audioProperties());
    fillFromProperties(data, f.file()->properties());
    return data;
}
