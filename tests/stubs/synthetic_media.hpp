#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include "core/media_capabilities.hpp"

/**
 * @brief Frame decoder that paints frames from a color function of time
 *
 * No media file is read; the path is ignored. Readers report their lifetime
 * through open_readers so tests can check that sessions are released.
 */
class SyntheticFrameDecoder : public FrameDecoder
{
public:
    using ColorFunction = std::function<cv::Scalar(double)>;

    SyntheticFrameDecoder(const VideoStreamInfo &info, ColorFunction color_at);

    bool isAvailable() const override { return true; }
    std::optional<VideoStreamInfo> probe(const std::string &file_path) const override;
    std::unique_ptr<FrameReader> openReader(const std::string &file_path, int target_width) const override;

    // Timestamps (exact) for which the reader returns no image
    std::set<double> undecodable_timestamps;
    // Throw from readFrameAt instead of decoding
    bool throw_on_read = false;

    std::shared_ptr<std::atomic<int>> open_readers;
    std::shared_ptr<std::atomic<int>> frames_read;

    static VideoStreamInfo makeInfo(double duration_seconds, double fps, int width = 64, int height = 36);

private:
    VideoStreamInfo info_;
    ColorFunction color_at_;
};

/**
 * @brief Audio decoder producing a 440 Hz tone shaped by an amplitude envelope
 */
class SyntheticAudioDecoder : public AudioDecoder
{
public:
    using Envelope = std::function<double(double)>;

    SyntheticAudioDecoder(double duration_seconds, Envelope envelope);

    /**
     * @brief Decoder that reports a fixed non-available status
     */
    explicit SyntheticAudioDecoder(AudioExtractionStatus status);

    bool isAvailable() const override { return true; }
    AudioExtraction decode(const std::string &file_path, int target_sample_rate,
                           const CancellationToken *token) const override;

    bool throw_on_decode = false;

    static AudioSignal makeSignal(double duration_seconds, int sample_rate, const Envelope &envelope);

private:
    double duration_seconds_;
    Envelope envelope_;
    AudioExtractionStatus status_;
};

/**
 * @brief Envelope alternating between two levels every period seconds
 */
SyntheticAudioDecoder::Envelope alternatingEnvelope(double low, double high, double period = 1.0);

/**
 * @brief Wraps an envelope with true silence between start and end seconds
 */
SyntheticAudioDecoder::Envelope withSilence(SyntheticAudioDecoder::Envelope envelope, double start, double end);
