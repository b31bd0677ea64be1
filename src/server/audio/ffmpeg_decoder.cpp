#include "audio/ffmpeg_decoder.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/log.h>
#include <libswresample/swresample.h>
}

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <memory>

namespace {

constexpr int kIoBufferSize = 4096;

struct MemoryReader {
    std::span<const uint8_t> data;
    size_t pos = 0;
};

int read_packet(void* opaque, uint8_t* buf, int buf_size) {
    auto* r = static_cast<MemoryReader*>(opaque);
    size_t left = r->data.size() - r->pos;
    if (left == 0) return AVERROR_EOF;
    size_t n = std::min(left, static_cast<size_t>(buf_size));
    std::memcpy(buf, r->data.data() + r->pos, n);
    r->pos += n;
    return static_cast<int>(n);
}

int64_t seek_packet(void* opaque, int64_t offset, int whence) {
    auto* r = static_cast<MemoryReader*>(opaque);
    auto size = static_cast<int64_t>(r->data.size());
    if (whence & AVSEEK_SIZE) return size;

    int64_t base;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(r->pos); break;
        case SEEK_END: base = size; break;
        default: return AVERROR(EINVAL);
    }
    int64_t target = base + offset;
    if (target < 0 || target > size) return AVERROR(EINVAL);
    r->pos = static_cast<size_t>(target);
    return target;
}

struct FormatCloser {
    void operator()(AVFormatContext* f) const { avformat_close_input(&f); }
};
struct IoFreer {
    void operator()(AVIOContext* io) const {
        av_freep(&io->buffer);
        avio_context_free(&io);
    }
};
struct CodecFreer {
    void operator()(AVCodecContext* c) const { avcodec_free_context(&c); }
};
struct PacketFreer {
    void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct FrameFreer {
    void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct SwrFreer {
    void operator()(SwrContext* s) const { swr_free(&s); }
};

std::string av_error(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

} // namespace

FfmpegDecoder::FfmpegDecoder() {
    // Probe chatter for garbage uploads would otherwise go to stderr.
    av_log_set_level(AV_LOG_ERROR);
}

FfmpegDecoder::~FfmpegDecoder() = default;

std::expected<DecodedAudio, std::string> FfmpegDecoder::decode(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return std::unexpected("empty audio payload");
    }

    MemoryReader reader{.data = bytes, .pos = 0};

    auto* io_buf = static_cast<uint8_t*>(av_malloc(kIoBufferSize));
    if (!io_buf) return std::unexpected("out of memory");

    AVIOContext* raw_io = avio_alloc_context(io_buf, kIoBufferSize, 0, &reader,
                                             read_packet, nullptr, seek_packet);
    if (!raw_io) {
        av_free(io_buf);
        return std::unexpected("avio_alloc_context failed");
    }
    // Declared before the format context so it is released after it.
    std::unique_ptr<AVIOContext, IoFreer> io(raw_io);

    AVFormatContext* raw_fmt = avformat_alloc_context();
    if (!raw_fmt) return std::unexpected("avformat_alloc_context failed");
    raw_fmt->pb = io.get();
    raw_fmt->flags |= AVFMT_FLAG_CUSTOM_IO;

    // avformat_open_input frees the context on failure.
    int rc = avformat_open_input(&raw_fmt, nullptr, nullptr, nullptr);
    if (rc < 0) {
        return std::unexpected("unrecognized audio format: " + av_error(rc));
    }
    std::unique_ptr<AVFormatContext, FormatCloser> fmt(raw_fmt);

    rc = avformat_find_stream_info(fmt.get(), nullptr);
    if (rc < 0) {
        return std::unexpected("could not read stream info: " + av_error(rc));
    }

    const AVCodec* codec = nullptr;
    int stream_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (stream_index < 0 || !codec) {
        return std::unexpected("no audio stream found");
    }
    AVStream* stream = fmt->streams[stream_index];

    std::unique_ptr<AVCodecContext, CodecFreer> dec(avcodec_alloc_context3(codec));
    if (!dec) return std::unexpected("avcodec_alloc_context3 failed");

    rc = avcodec_parameters_to_context(dec.get(), stream->codecpar);
    if (rc < 0) return std::unexpected("bad codec parameters: " + av_error(rc));

    rc = avcodec_open2(dec.get(), codec, nullptr);
    if (rc < 0) return std::unexpected("could not open decoder: " + av_error(rc));

    if (dec->sample_rate <= 0 || dec->ch_layout.nb_channels <= 0) {
        return std::unexpected("audio stream has no sample rate or channels");
    }

    AVChannelLayout layout{};
    if (dec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&layout, dec->ch_layout.nb_channels);
    } else if (av_channel_layout_copy(&layout, &dec->ch_layout) < 0) {
        return std::unexpected("could not copy channel layout");
    }

    // Sample format conversion only: rate and layout pass through unchanged.
    SwrContext* raw_swr = nullptr;
    rc = swr_alloc_set_opts2(&raw_swr,
                             &layout, AV_SAMPLE_FMT_FLT, dec->sample_rate,
                             &layout, dec->sample_fmt, dec->sample_rate,
                             0, nullptr);
    std::unique_ptr<SwrContext, SwrFreer> swr(raw_swr);
    av_channel_layout_uninit(&layout);
    if (rc < 0 || !swr || swr_init(swr.get()) < 0) {
        return std::unexpected("could not set up sample conversion");
    }

    DecodedAudio out;
    out.sample_rate = static_cast<uint32_t>(dec->sample_rate);
    out.channels = static_cast<uint32_t>(dec->ch_layout.nb_channels);

    std::unique_ptr<AVPacket, PacketFreer> pkt(av_packet_alloc());
    std::unique_ptr<AVFrame, FrameFreer> frame(av_frame_alloc());
    if (!pkt || !frame) return std::unexpected("out of memory");

    std::vector<float> scratch;
    auto drain = [&]() -> bool {
        while (true) {
            int r = avcodec_receive_frame(dec.get(), frame.get());
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return true;
            if (r < 0) return false;

            int n = frame->nb_samples;
            scratch.resize(static_cast<size_t>(n) * out.channels);
            auto* dst = reinterpret_cast<uint8_t*>(scratch.data());
            int got = swr_convert(swr.get(), &dst, n,
                                  const_cast<const uint8_t**>(frame->extended_data), n);
            av_frame_unref(frame.get());
            if (got < 0) return false;
            out.samples.insert(out.samples.end(), scratch.begin(),
                               scratch.begin() + static_cast<ptrdiff_t>(got) * out.channels);
        }
    };

    while (av_read_frame(fmt.get(), pkt.get()) >= 0) {
        if (pkt->stream_index == stream_index) {
            rc = avcodec_send_packet(dec.get(), pkt.get());
            av_packet_unref(pkt.get());
            // Corrupt packets are dropped, the rest of the stream may still decode.
            if (rc < 0) continue;
            if (!drain()) return std::unexpected("decoding failed");
        } else {
            av_packet_unref(pkt.get());
        }
    }

    avcodec_send_packet(dec.get(), nullptr);
    if (!drain()) return std::unexpected("decoding failed");

    if (out.samples.empty()) {
        return std::unexpected("audio contains no samples");
    }
    return out;
}
