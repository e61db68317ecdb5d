#pragma once

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QtEndian>

#include <taglib/id3v2tag.h>
#include <taglib/textidentificationframe.h>
#include <taglib/wavfile.h>

#include <algorithm>
#include <cmath>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// Synthetic signals and fixture files shared by the tests.
namespace TestAudio {

inline std::vector<float> sine(double freq, double secs, int rate, float amplitude)
{
    std::vector<float> out(size_t(secs * rate));
    for (size_t i = 0; i < out.size(); ++i)
        out[i] = amplitude * float(std::sin(2.0 * M_PI * freq * double(i) / rate));
    return out;
}

// Short decaying 1 kHz bursts on every beat
inline std::vector<float> clicks(double bpm, double secs, int rate)
{
    std::vector<float> out(size_t(secs * rate), 0.0f);
    const double period = 60.0 * rate / bpm;
    const int burst = rate / 100;   // 10 ms
    for (double pos = 0.0; pos < double(out.size()); pos += period) {
        size_t start = size_t(pos);
        for (int i = 0; i < burst && start + size_t(i) < out.size(); ++i) {
            double env = 1.0 - double(i) / burst;
            out[start + size_t(i)] = float(0.9 * env * std::sin(2.0 * M_PI * 1000.0 * i / rate));
        }
    }
    return out;
}

inline std::vector<float> mix(const std::vector<std::vector<float>>& parts)
{
    std::vector<float> out;
    for (const auto& p : parts) {
        if (p.size() > out.size()) out.resize(p.size(), 0.0f);
        for (size_t i = 0; i < p.size(); ++i) out[i] += p[i];
    }
    return out;
}

// 16-bit PCM mono RIFF/WAVE
inline bool writeWav(const QString& path, const std::vector<float>& samples, int rate)
{
    QByteArray pcm;
    pcm.resize(int(samples.size() * 2));
    for (size_t i = 0; i < samples.size(); ++i) {
        float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        qToLittleEndian<qint16>(qint16(std::lround(s * 32767.0f)),
                                reinterpret_cast<uchar*>(pcm.data()) + i * 2);
    }

    QByteArray header;
    auto put32 = [&header](quint32 v) {
        uchar b[4];
        qToLittleEndian<quint32>(v, b);
        header.append(reinterpret_cast<const char*>(b), 4);
    };
    auto put16 = [&header](quint16 v) {
        uchar b[2];
        qToLittleEndian<quint16>(v, b);
        header.append(reinterpret_cast<const char*>(b), 2);
    };

    header.append("RIFF", 4);
    put32(quint32(36 + pcm.size()));
    header.append("WAVE", 4);
    header.append("fmt ", 4);
    put32(16);
    put16(1);                   // PCM
    put16(1);                   // mono
    put32(quint32(rate));
    put32(quint32(rate * 2));   // byte rate
    put16(2);                   // block align
    put16(16);                  // bits per sample
    header.append("data", 4);
    put32(quint32(pcm.size()));

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return false;
    return f.write(header) == header.size() && f.write(pcm) == pcm.size();
}

// Adds an ID3v2 chunk with a title and a TBPM frame.
// TagLib skips writing a tag whose basic fields are all empty.
inline bool tagWavBpm(const QString& path, const QString& bpm)
{
    TagLib::RIFF::WAV::File f(path.toUtf8().constData());
    if (!f.isValid())
        return false;
    f.ID3v2Tag()->setTitle("Tagged");
    auto* frame = new TagLib::ID3v2::TextIdentificationFrame("TBPM", TagLib::String::Latin1);
    frame->setText(TagLib::String(bpm.toUtf8().constData(), TagLib::String::UTF8));
    f.ID3v2Tag()->addFrame(frame);
    return f.save();
}

// Bytes no audio parser accepts
inline bool writeGarbage(const QString& path, int size)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return false;
    return f.write(QByteArray(size, 'x')) == size;
}

inline bool touch(const QString& path, const QByteArray& content = QByteArray())
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return false;
    return f.write(content) == content.size();
}

} // namespace TestAudio
