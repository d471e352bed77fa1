#include "synthetic_media.hpp"
#include <algorithm>
#include <cmath>

namespace
{
    constexpr double kToneHz = 440.0;
    constexpr double kPi = 3.14159265358979323846;

    class SyntheticFrameReader : public FrameReader
    {
    public:
        SyntheticFrameReader(const SyntheticFrameDecoder &decoder, const VideoStreamInfo &info,
                             SyntheticFrameDecoder::ColorFunction color_at, int target_width)
            : undecodable_(decoder.undecodable_timestamps), throw_on_read_(decoder.throw_on_read),
              open_readers_(decoder.open_readers), frames_read_(decoder.frames_read),
              info_(info), color_at_(std::move(color_at))
        {
            width_ = std::min(target_width, info.width);
            height_ = std::max(1, info.height * width_ / std::max(1, info.width));
            ++(*open_readers_);
        }

        ~SyntheticFrameReader() override
        {
            --(*open_readers_);
        }

        cv::Mat readFrameAt(double seconds) override
        {
            if (throw_on_read_)
            {
                throw std::runtime_error("synthetic decoder failure");
            }
            if (undecodable_.count(seconds))
            {
                return cv::Mat();
            }
            ++(*frames_read_);
            double t = std::min(seconds, info_.duration_seconds);
            return cv::Mat(height_, width_, CV_8UC3, color_at_(t));
        }

    private:
        std::set<double> undecodable_;
        bool throw_on_read_;
        std::shared_ptr<std::atomic<int>> open_readers_;
        std::shared_ptr<std::atomic<int>> frames_read_;
        VideoStreamInfo info_;
        SyntheticFrameDecoder::ColorFunction color_at_;
        int width_;
        int height_;
    };
}

SyntheticFrameDecoder::SyntheticFrameDecoder(const VideoStreamInfo &info, ColorFunction color_at)
    : open_readers(std::make_shared<std::atomic<int>>(0)),
      frames_read(std::make_shared<std::atomic<int>>(0)),
      info_(info), color_at_(std::move(color_at))
{
}

std::optional<VideoStreamInfo> SyntheticFrameDecoder::probe(const std::string &) const
{
    return info_;
}

std::unique_ptr<FrameReader> SyntheticFrameDecoder::openReader(const std::string &, int target_width) const
{
    return std::make_unique<SyntheticFrameReader>(*this, info_, color_at_, target_width);
}

VideoStreamInfo SyntheticFrameDecoder::makeInfo(double duration_seconds, double fps, int width, int height)
{
    VideoStreamInfo info;
    info.fps = fps;
    info.duration_seconds = duration_seconds;
    info.frame_count = std::llround(duration_seconds * fps);
    info.width = width;
    info.height = height;
    return info;
}

SyntheticAudioDecoder::SyntheticAudioDecoder(double duration_seconds, Envelope envelope)
    : duration_seconds_(duration_seconds), envelope_(std::move(envelope)), status_(AudioExtractionStatus::AVAILABLE)
{
}

SyntheticAudioDecoder::SyntheticAudioDecoder(AudioExtractionStatus status)
    : duration_seconds_(0.0), status_(status)
{
}

AudioExtraction SyntheticAudioDecoder::decode(const std::string &, int target_sample_rate,
                                              const CancellationToken *token) const
{
    if (token)
    {
        token->throwIfCancelled("audio decoding");
    }
    if (throw_on_decode)
    {
        throw std::runtime_error("synthetic audio decoder failure");
    }
    if (status_ != AudioExtractionStatus::AVAILABLE)
    {
        return AudioExtraction(status_, "synthetic");
    }
    AudioExtraction extraction(AudioExtractionStatus::AVAILABLE, "");
    extraction.signal = makeSignal(duration_seconds_, target_sample_rate, envelope_);
    return extraction;
}

AudioSignal SyntheticAudioDecoder::makeSignal(double duration_seconds, int sample_rate, const Envelope &envelope)
{
    AudioSignal signal;
    signal.sample_rate = sample_rate;
    size_t count = static_cast<size_t>(std::llround(duration_seconds * sample_rate));
    signal.samples.resize(count);
    for (size_t i = 0; i < count; ++i)
    {
        double t = static_cast<double>(i) / sample_rate;
        signal.samples[i] = static_cast<float>(envelope(t) * std::sin(2.0 * kPi * kToneHz * t));
    }
    return signal;
}

SyntheticAudioDecoder::Envelope alternatingEnvelope(double low, double high, double period)
{
    return [=](double t)
    {
        return static_cast<long long>(std::floor(t / period)) % 2 == 0 ? high : low;
    };
}

SyntheticAudioDecoder::Envelope withSilence(SyntheticAudioDecoder::Envelope envelope, double start, double end)
{
    return [=](double t)
    {
        return (t >= start && t < end) ? 0.0 : envelope(t);
    };
}
