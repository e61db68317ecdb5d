#include "AudioDecoder.h"
#include <QDebug>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

struct AudioDecoder::Impl {
    AVFormatContext* fmtCtx   = nullptr;
    AVCodecContext*  codecCtx = nullptr;
    SwrContext*      swrCtx   = nullptr;
    AVPacket*        packet   = nullptr;
    AVFrame*         frame    = nullptr;

    int              audioStreamIndex = -1;
    AudioStreamFormat streamFormat;
    int64_t          framesDecoded = 0;  // total frames output so far
    bool             opened = false;
    bool             eof = false;
    QString          error;

    // Converted samples not yet handed out
    std::vector<float> residual;
    size_t           residualOffset = 0;

    // Set by seek(): drop output until this position is reached
    double           seekTarget = -1.0;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        residual.clear();
        residualOffset = 0;
        if (frame)    { av_frame_free(&frame); }
        if (packet)   { av_packet_free(&packet); }
        if (swrCtx)   { swr_free(&swrCtx); }
        if (codecCtx) { avcodec_free_context(&codecCtx); }
        if (fmtCtx)   { avformat_close_input(&fmtCtx); }
        audioStreamIndex = -1;
        framesDecoded = 0;
        seekTarget = -1.0;
        opened = false;
        eof = false;
    }

    bool fail(const QString& message) {
        error = message;
        cleanup();
        return false;
    }

    // Convert the frame currently in `frame` and append it to `residual`
    void convertFrame() {
        int capacity = swr_get_out_samples(swrCtx, frame->nb_samples);
        if (capacity <= 0) return;

        size_t base = residual.size();
        residual.resize(base + size_t(capacity));
        float* out = residual.data() + base;

        int converted = swr_convert(swrCtx,
                                    reinterpret_cast<uint8_t**>(&out), capacity,
                                    const_cast<const uint8_t**>(frame->extended_data),
                                    frame->nb_samples);
        residual.resize(base + size_t(std::max(converted, 0)));

        if (seekTarget >= 0.0 && converted > 0) {
            double frameStart = 0.0;
            if (frame->best_effort_timestamp != AV_NOPTS_VALUE) {
                AVStream* stream = fmtCtx->streams[audioStreamIndex];
                frameStart = frame->best_effort_timestamp * av_q2d(stream->time_base);
            }
            int64_t skip = int64_t(std::llround((seekTarget - frameStart) * streamFormat.sampleRate));
            skip = std::clamp<int64_t>(skip, 0, converted);
            residual.erase(residual.begin() + long(base),
                           residual.begin() + long(base + size_t(skip)));
            if (skip < converted)
                seekTarget = -1.0;
        }
    }

    // Decode until at least one converted frame is available or EOF
    bool refill() {
        while (!eof) {
            int ret = av_read_frame(fmtCtx, packet);
            if (ret < 0) {
                // Drain the decoder on end of file or read error
                avcodec_send_packet(codecCtx, nullptr);
                while (avcodec_receive_frame(codecCtx, frame) == 0) {
                    convertFrame();
                    av_frame_unref(frame);
                }
                eof = true;
                break;
            }

            if (packet->stream_index != audioStreamIndex) {
                av_packet_unref(packet);
                continue;
            }

            ret = avcodec_send_packet(codecCtx, packet);
            av_packet_unref(packet);
            if (ret < 0) continue;

            bool produced = false;
            while (avcodec_receive_frame(codecCtx, frame) == 0) {
                convertFrame();
                av_frame_unref(frame);
                produced = true;
            }
            if (produced && residual.size() > residualOffset)
                return true;
        }
        return residual.size() > residualOffset;
    }
};

AudioDecoder::AudioDecoder()
    : m_impl(std::make_unique<Impl>())
{
}

AudioDecoder::~AudioDecoder() = default;

bool AudioDecoder::open(const QString& filePath, int outSampleRate)
{
    close();

    auto& d = *m_impl;
    d.error.clear();

    if (outSampleRate <= 0)
        return d.fail(QStringLiteral("Invalid analysis sample rate"));

    // Open input
    if (avformat_open_input(&d.fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr) < 0)
        return d.fail(QStringLiteral("Unable to open input"));

    if (avformat_find_stream_info(d.fmtCtx, nullptr) < 0)
        return d.fail(QStringLiteral("No stream information"));

    // Find best audio stream
    d.audioStreamIndex = av_find_best_stream(d.fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (d.audioStreamIndex < 0)
        return d.fail(QStringLiteral("No audio stream"));

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec)
        return d.fail(QStringLiteral("No decoder for codec"));

    d.codecCtx = avcodec_alloc_context3(codec);
    if (!d.codecCtx)
        return d.fail(QStringLiteral("Out of memory"));
    if (avcodec_parameters_to_context(d.codecCtx, stream->codecpar) < 0)
        return d.fail(QStringLiteral("Bad codec parameters"));
    if (avcodec_open2(d.codecCtx, codec, nullptr) < 0)
        return d.fail(QStringLiteral("Unable to open decoder"));

    // Downmix to mono float32 at the analysis rate
    AVChannelLayout outLayout;
    av_channel_layout_default(&outLayout, 1);

    int ret = swr_alloc_set_opts2(
        &d.swrCtx,
        &outLayout,                    // out layout
        AV_SAMPLE_FMT_FLT,             // out format
        outSampleRate,                 // out sample rate
        &d.codecCtx->ch_layout,        // in layout
        d.codecCtx->sample_fmt,        // in format
        d.codecCtx->sample_rate,       // in sample rate
        0, nullptr
    );
    if (ret < 0 || swr_init(d.swrCtx) < 0)
        return d.fail(QStringLiteral("Unable to initialise resampler"));

    d.packet = av_packet_alloc();
    d.frame  = av_frame_alloc();
    if (!d.packet || !d.frame)
        return d.fail(QStringLiteral("Out of memory"));

    d.streamFormat = AudioStreamFormat();
    d.streamFormat.sampleRate       = outSampleRate;
    d.streamFormat.channels         = 1;
    d.streamFormat.sourceSampleRate = d.codecCtx->sample_rate;
    d.streamFormat.sourceChannels   = d.codecCtx->ch_layout.nb_channels;

    if (stream->duration != AV_NOPTS_VALUE) {
        double tb = av_q2d(stream->time_base);
        d.streamFormat.durationSecs = stream->duration * tb;
    } else if (d.fmtCtx->duration != AV_NOPTS_VALUE) {
        d.streamFormat.durationSecs = d.fmtCtx->duration / (double)AV_TIME_BASE;
    }

    d.streamFormat.totalFrames = (int64_t)(d.streamFormat.durationSecs * outSampleRate);

    d.opened = true;
    return true;
}

void AudioDecoder::close()
{
    m_impl->cleanup();
}

int AudioDecoder::read(float* buf, int maxFrames)
{
    auto& d = *m_impl;
    if (!d.opened || maxFrames <= 0) return 0;

    int framesWritten = 0;
    while (framesWritten < maxFrames) {
        if (d.residualOffset >= d.residual.size()) {
            d.residual.clear();
            d.residualOffset = 0;
            if (!d.refill()) break;
        }

        size_t available = d.residual.size() - d.residualOffset;
        int toCopy = int(std::min<size_t>(available, size_t(maxFrames - framesWritten)));
        std::memcpy(buf + framesWritten, d.residual.data() + d.residualOffset,
                    size_t(toCopy) * sizeof(float));
        d.residualOffset += size_t(toCopy);
        framesWritten += toCopy;
    }

    d.framesDecoded += framesWritten;
    return framesWritten;
}

bool AudioDecoder::seek(double secs)
{
    auto& d = *m_impl;
    if (!d.opened) return false;

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    int64_t ts = (int64_t)(secs / av_q2d(stream->time_base));

    if (av_seek_frame(d.fmtCtx, d.audioStreamIndex, ts, AVSEEK_FLAG_BACKWARD) < 0)
        return false;

    avcodec_flush_buffers(d.codecCtx);
    d.residual.clear();
    d.residualOffset = 0;
    d.eof = false;
    d.seekTarget = secs;
    d.framesDecoded = (int64_t)(secs * d.streamFormat.sampleRate);
    return true;
}

AudioStreamFormat AudioDecoder::format() const
{
    return m_impl->streamFormat;
}

QString AudioDecoder::errorString() const
{
    return m_impl->error;
}

// ── Bounded excerpt ─────────────────────────────────────────────────
std::optional<AudioExcerpt> AudioDecoder::readExcerpt(const QString& filePath,
                                                      int sampleRate,
                                                      double offsetSecs,
                                                      double durationSecs)
{
    if (durationSecs <= 0.0)
        return std::nullopt;

    AudioDecoder decoder;
    if (!decoder.open(filePath, sampleRate)) {
        qDebug() << "[Decoder] Cannot decode" << filePath << "-" << decoder.errorString();
        return std::nullopt;
    }

    AudioExcerpt excerpt;
    excerpt.sampleRate = sampleRate;
    excerpt.fileDurationSecs = decoder.format().durationSecs;

    double offset = std::max(0.0, offsetSecs);
    if (excerpt.fileDurationSecs > 0.0)
        offset = std::min(offset, std::max(0.0, excerpt.fileDurationSecs - durationSecs));

    if (offset > 0.0 && !decoder.seek(offset)) {
        // Unseekable stream: decode from the start and discard
        decoder.close();
        if (!decoder.open(filePath, sampleRate))
            return std::nullopt;
        std::vector<float> scratch(4096);
        int64_t toSkip = int64_t(offset * sampleRate);
        while (toSkip > 0) {
            int n = decoder.read(scratch.data(), int(std::min<int64_t>(toSkip, 4096)));
            if (n <= 0) break;
            toSkip -= n;
        }
    }
    excerpt.offsetSecs = offset;

    size_t wanted = size_t(durationSecs * sampleRate);
    excerpt.samples.resize(wanted);
    size_t got = 0;
    while (got < wanted) {
        int n = decoder.read(excerpt.samples.data() + got,
                             int(std::min<size_t>(wanted - got, 8192)));
        if (n <= 0) break;
        got += size_t(n);
    }
    excerpt.samples.resize(got);

    if (excerpt.samples.empty()) {
        qDebug() << "[Decoder] No samples decoded from" << filePath;
        return std::nullopt;
    }
    return excerpt;
}
