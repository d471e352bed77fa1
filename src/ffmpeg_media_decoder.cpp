#include "core/ffmpeg_media_decoder.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/quality_types.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

extern "C"
{
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
}

namespace
{
    std::string ffmpegError(int code)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE];
        av_strerror(code, err_buf, AV_ERROR_MAX_STRING_SIZE);
        return std::string(err_buf);
    }

    bool openContainer(const std::string &file_path, AVFormatContextRAII &format_ctx)
    {
        int result = avformat_open_input(format_ctx.address(), file_path.c_str(), nullptr, nullptr);
        if (result < 0)
        {
            Logger::warn("Could not open media file (possibly corrupted or unsupported format): " + file_path + " - " + ffmpegError(result));
            return false;
        }
        result = avformat_find_stream_info(format_ctx.get(), nullptr);
        if (result < 0)
        {
            Logger::warn("Could not find stream information (file may be corrupted): " + file_path + " - " + ffmpegError(result));
            return false;
        }
        return true;
    }

    bool openCodec(AVStream *stream, AVCodecContextRAII &codec_ctx, const std::string &file_path)
    {
        const AVCodec *codec = avcodec_find_decoder(stream->codecpar->codec_id);
        if (!codec)
        {
            Logger::warn("Unsupported codec in " + file_path);
            return false;
        }
        AVCodecContext *temp_codec_ctx = avcodec_alloc_context3(codec);
        if (!temp_codec_ctx)
        {
            Logger::error("Could not allocate decoder context for " + file_path);
            return false;
        }
        codec_ctx.set(temp_codec_ctx);
        if (avcodec_parameters_to_context(codec_ctx.get(), stream->codecpar) < 0)
        {
            Logger::warn("Could not copy codec parameters for " + file_path);
            return false;
        }
        int result = avcodec_open2(codec_ctx.get(), codec, nullptr);
        if (result < 0)
        {
            Logger::warn("Could not open decoder for " + file_path + " - " + ffmpegError(result));
            return false;
        }
        return true;
    }

    double streamDurationSeconds(const AVFormatContext *format_ctx, const AVStream *stream)
    {
        if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        {
            return stream->duration * av_q2d(stream->time_base);
        }
        if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0)
        {
            return static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
        }
        return 0.0;
    }

    // Owns a channel layout copy for the lifetime of a decode call
    class ChannelLayoutHolder
    {
    public:
        ChannelLayoutHolder() { layout_ = AVChannelLayout{}; }
        ~ChannelLayoutHolder() { av_channel_layout_uninit(&layout_); }

        ChannelLayoutHolder(const ChannelLayoutHolder &) = delete;
        ChannelLayoutHolder &operator=(const ChannelLayoutHolder &) = delete;

        AVChannelLayout *get() { return &layout_; }

    private:
        AVChannelLayout layout_;
    };

    class FFmpegFrameReader : public FrameReader
    {
    public:
        FFmpegFrameReader(const std::string &file_path, int target_width)
            : file_path_(file_path), target_width_(std::max(1, target_width)), stream_index_(-1),
              time_base_(0.0), start_pts_(0), half_frame_seconds_(0.0), sws_src_w_(0), sws_src_h_(0),
              sws_src_fmt_(-1)
        {
        }

        bool open()
        {
            if (!openContainer(file_path_, format_ctx_))
            {
                return false;
            }
            stream_index_ = av_find_best_stream(format_ctx_.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
            if (stream_index_ < 0)
            {
                Logger::warn("No video stream found in " + file_path_);
                return false;
            }
            AVStream *stream = format_ctx_.get()->streams[stream_index_];
            if (!openCodec(stream, codec_ctx_, file_path_))
            {
                return false;
            }

            time_base_ = av_q2d(stream->time_base);
            start_pts_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
            AVRational rate = av_guess_frame_rate(format_ctx_.get(), stream, nullptr);
            half_frame_seconds_ = (rate.num > 0 && rate.den > 0) ? 0.5 / av_q2d(rate) : 0.0;

            frame_.set(av_frame_alloc());
            last_frame_.set(av_frame_alloc());
            packet_.set(av_packet_alloc());
            if (!frame_.get() || !last_frame_.get() || !packet_.get())
            {
                Logger::error("Could not allocate frame or packet for " + file_path_);
                return false;
            }
            return time_base_ > 0.0;
        }

        cv::Mat readFrameAt(double seconds) override
        {
            AVFormatContext *format_ctx = format_ctx_.get();
            AVCodecContext *codec_ctx = codec_ctx_.get();
            AVFrame *frame = frame_.get();
            AVFrame *last = last_frame_.get();
            AVPacket *packet = packet_.get();

            int64_t target_pts = start_pts_ + static_cast<int64_t>(std::llround(seconds / time_base_));
            int seek_result = av_seek_frame(format_ctx, stream_index_, target_pts, AVSEEK_FLAG_BACKWARD);
            if (seek_result < 0)
            {
                Logger::debug("Seek to " + std::to_string(seconds) + "s failed in " + file_path_ + " - " + ffmpegError(seek_result));
            }
            avcodec_flush_buffers(codec_ctx);
            av_frame_unref(last);

            bool have_frame = false;
            bool reached = false;
            bool draining = false;
            while (!reached && !draining)
            {
                int read_result = av_read_frame(format_ctx, packet);
                if (read_result < 0)
                {
                    // End of stream: drain buffered frames; the last one stands in for positions past the end
                    avcodec_send_packet(codec_ctx, nullptr);
                    draining = true;
                }
                else if (packet->stream_index != stream_index_)
                {
                    av_packet_unref(packet);
                    continue;
                }
                else
                {
                    int send_result = avcodec_send_packet(codec_ctx, packet);
                    av_packet_unref(packet);
                    if (send_result < 0)
                    {
                        continue;
                    }
                }

                while (true)
                {
                    int response = avcodec_receive_frame(codec_ctx, frame);
                    if (response < 0)
                    {
                        break;
                    }
                    if (frame->flags & AV_FRAME_FLAG_CORRUPT)
                    {
                        av_frame_unref(frame);
                        continue;
                    }
                    av_frame_unref(last);
                    av_frame_move_ref(last, frame);
                    have_frame = true;

                    int64_t pts = last->best_effort_timestamp;
                    if (pts == AV_NOPTS_VALUE ||
                        (pts - start_pts_) * time_base_ >= seconds - half_frame_seconds_)
                    {
                        reached = true;
                        break;
                    }
                }
            }

            if (!have_frame)
            {
                return cv::Mat();
            }
            return toBgr(last);
        }

    private:
        cv::Mat toBgr(const AVFrame *src)
        {
            int src_w = src->width;
            int src_h = src->height;
            if (src_w <= 0 || src_h <= 0)
            {
                return cv::Mat();
            }
            int dst_w = std::min(target_width_, src_w);
            int dst_h = std::max(1, static_cast<int>(std::lround(static_cast<double>(src_h) * dst_w / src_w)));

            if (!sws_ctx_.get() || sws_src_w_ != src_w || sws_src_h_ != src_h || sws_src_fmt_ != src->format)
            {
                sws_ctx_.set(sws_getContext(src_w, src_h, static_cast<AVPixelFormat>(src->format),
                                            dst_w, dst_h, AV_PIX_FMT_BGR24,
                                            SWS_AREA, nullptr, nullptr, nullptr));
                sws_src_w_ = src_w;
                sws_src_h_ = src_h;
                sws_src_fmt_ = src->format;
                if (!sws_ctx_.get())
                {
                    Logger::error("Could not create scaler context for " + file_path_);
                    return cv::Mat();
                }
            }

            cv::Mat image(dst_h, dst_w, CV_8UC3);
            uint8_t *dst_data[4] = {image.data, nullptr, nullptr, nullptr};
            int dst_linesize[4] = {static_cast<int>(image.step[0]), 0, 0, 0};
            sws_scale(sws_ctx_.get(), src->data, src->linesize, 0, src_h, dst_data, dst_linesize);
            return image;
        }

        std::string file_path_;
        int target_width_;
        AVFormatContextRAII format_ctx_;
        AVCodecContextRAII codec_ctx_;
        AVFrameRAII frame_, last_frame_;
        AVPacketRAII packet_;
        SwsContextRAII sws_ctx_;
        int stream_index_;
        double time_base_;
        int64_t start_pts_;
        double half_frame_seconds_;
        int sws_src_w_;
        int sws_src_h_;
        int sws_src_fmt_;
    };
}

std::optional<VideoStreamInfo> FFmpegFrameDecoder::probe(const std::string &file_path) const
{
    AVFormatContextRAII format_ctx;
    if (!openContainer(file_path, format_ctx))
    {
        return std::nullopt;
    }
    int stream_index = av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (stream_index < 0)
    {
        Logger::debug("No video stream in " + file_path);
        return std::nullopt;
    }

    AVStream *stream = format_ctx.get()->streams[stream_index];
    VideoStreamInfo info;
    AVRational rate = av_guess_frame_rate(format_ctx.get(), stream, nullptr);
    info.fps = (rate.num > 0 && rate.den > 0) ? av_q2d(rate) : 0.0;
    info.duration_seconds = streamDurationSeconds(format_ctx.get(), stream);
    if (stream->nb_frames > 0)
    {
        info.frame_count = stream->nb_frames;
    }
    else if (info.fps > 0.0)
    {
        info.frame_count = std::llround(info.duration_seconds * info.fps);
    }
    info.width = stream->codecpar->width;
    info.height = stream->codecpar->height;

    Logger::debug("Video info - Duration: " + std::to_string(info.duration_seconds) +
                  "s, FPS: " + std::to_string(info.fps) +
                  ", Frames: " + std::to_string(info.frame_count));
    return info;
}

std::unique_ptr<FrameReader> FFmpegFrameDecoder::openReader(const std::string &file_path, int target_width) const
{
    auto reader = std::make_unique<FFmpegFrameReader>(file_path, target_width);
    if (!reader->open())
    {
        return nullptr;
    }
    return reader;
}

AudioExtraction FFmpegAudioDecoder::decode(const std::string &file_path, int target_sample_rate,
                                           const CancellationToken *token) const
{
    AVFormatContextRAII format_ctx;
    if (!openContainer(file_path, format_ctx))
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "could not open container");
    }

    int stream_index = av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_index == AVERROR_STREAM_NOT_FOUND)
    {
        Logger::info("No audio track in " + file_path);
        return AudioExtraction(AudioExtractionStatus::NO_AUDIO_TRACK, "no audio stream");
    }
    if (stream_index < 0)
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "no decodable audio stream: " + ffmpegError(stream_index));
    }

    AVStream *stream = format_ctx.get()->streams[stream_index];
    AVCodecContextRAII codec_ctx;
    if (!openCodec(stream, codec_ctx, file_path))
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "could not open audio decoder");
    }

    int channels = codec_ctx.get()->ch_layout.nb_channels;
    if (channels <= 0 || codec_ctx.get()->sample_rate <= 0)
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "audio stream has no channels or sample rate");
    }

    ChannelLayoutHolder layout;
    if (codec_ctx.get()->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC)
    {
        av_channel_layout_default(layout.get(), channels);
    }
    else if (av_channel_layout_copy(layout.get(), &codec_ctx.get()->ch_layout) < 0)
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "could not copy channel layout");
    }

    SwrContextRAII swr_ctx;
    int result = swr_alloc_set_opts2(swr_ctx.address(),
                                     layout.get(), AV_SAMPLE_FMT_FLTP, target_sample_rate,
                                     layout.get(), codec_ctx.get()->sample_fmt, codec_ctx.get()->sample_rate,
                                     0, nullptr);
    if (result < 0 || (result = swr_init(swr_ctx.get())) < 0)
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "could not initialize resampler: " + ffmpegError(result));
    }

    AVPacketRAII packet(av_packet_alloc());
    AVFrameRAII frame(av_frame_alloc());
    if (!packet.get() || !frame.get())
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "could not allocate frame or packet");
    }

    AudioSignal signal;
    signal.sample_rate = target_sample_rate;
    std::vector<std::vector<float>> planes(channels);
    std::vector<uint8_t *> out(channels);
    bool conversion_failed = false;

    auto appendConverted = [&](const uint8_t **in, int in_count)
    {
        int capacity = swr_get_out_samples(swr_ctx.get(), in_count);
        if (capacity <= 0)
        {
            return;
        }
        for (int c = 0; c < channels; ++c)
        {
            planes[c].resize(capacity);
            out[c] = reinterpret_cast<uint8_t *>(planes[c].data());
        }
        int converted = swr_convert(swr_ctx.get(), out.data(), capacity, in, in_count);
        if (converted < 0)
        {
            conversion_failed = true;
            return;
        }
        for (int i = 0; i < converted; ++i)
        {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c)
            {
                sum += planes[c][i];
            }
            signal.samples.push_back(sum / channels);
        }
    };

    auto receiveFrames = [&]()
    {
        while (!conversion_failed)
        {
            int response = avcodec_receive_frame(codec_ctx.get(), frame.get());
            if (response < 0)
            {
                break;
            }
            appendConverted(const_cast<const uint8_t **>(frame.get()->extended_data), frame.get()->nb_samples);
            av_frame_unref(frame.get());
        }
    };

    int skipped_packets = 0;
    while (!conversion_failed && av_read_frame(format_ctx.get(), packet.get()) >= 0)
    {
        if (token)
        {
            token->throwIfCancelled("audio decoding");
        }
        if (packet.get()->stream_index != stream_index)
        {
            av_packet_unref(packet.get());
            continue;
        }
        int send_result = avcodec_send_packet(codec_ctx.get(), packet.get());
        av_packet_unref(packet.get());
        if (send_result < 0)
        {
            ++skipped_packets;
            continue;
        }
        receiveFrames();
    }

    // Flush decoder and resampler
    avcodec_send_packet(codec_ctx.get(), nullptr);
    receiveFrames();
    appendConverted(nullptr, 0);

    if (skipped_packets > 0)
    {
        Logger::warn("Skipped " + std::to_string(skipped_packets) + " undecodable audio packets in " + file_path);
    }
    if (conversion_failed)
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "audio resampling failed");
    }
    if (signal.samples.empty())
    {
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, "no audio samples decoded");
    }

    Logger::debug("Decoded " + std::to_string(signal.samples.size()) + " audio samples (" +
                  std::to_string(signal.durationSeconds()) + "s) from " + file_path);
    AudioExtraction extraction(AudioExtractionStatus::AVAILABLE, "");
    extraction.signal = std::move(signal);
    return extraction;
}
