#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/validator_config.hpp"

/**
 * @brief Cooperative cancellation flag shared between a caller and a validation run
 *
 * The caller may trigger it from any thread. Long-running loops poll it and
 * abort with ValidationCancelledError.
 */
class CancellationToken
{
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Throw ValidationCancelledError if cancellation was requested
     * @param where Short description of the interrupted step, used in the message
     */
    void throwIfCancelled(const std::string &where) const;

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Timing and geometry of the first video stream of a container
 */
struct VideoStreamInfo
{
    double fps;
    int64_t frame_count;
    double duration_seconds;
    int width;
    int height;

    VideoStreamInfo() : fps(0.0), frame_count(0), duration_seconds(0.0), width(0), height(0) {}
};

/**
 * @brief One decoded frame with its position in the artifact
 */
struct SampledFrame
{
    double timestamp_seconds;
    cv::Mat image; // 8-bit BGR

    SampledFrame() : timestamp_seconds(0.0) {}
    SampledFrame(double t, const cv::Mat &img) : timestamp_seconds(t), image(img) {}
};

/**
 * @brief Mono amplitude series at a fixed sample rate
 */
struct AudioSignal
{
    std::vector<float> samples;
    int sample_rate;

    AudioSignal() : sample_rate(0) {}

    double durationSeconds() const
    {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

enum class AudioExtractionStatus
{
    AVAILABLE,
    NO_AUDIO_TRACK,
    DECODER_UNAVAILABLE,
    DECODE_FAILED
};

/**
 * @brief Result of decoding the audio track
 *
 * Only AVAILABLE carries a signal. NO_AUDIO_TRACK and DECODER_UNAVAILABLE are
 * distinct from an available signal that happens to be silent.
 */
struct AudioExtraction
{
    AudioExtractionStatus status;
    AudioSignal signal;
    std::string detail;

    AudioExtraction() : status(AudioExtractionStatus::DECODER_UNAVAILABLE) {}
    AudioExtraction(AudioExtractionStatus s, const std::string &d) : status(s), detail(d) {}

    bool available() const { return status == AudioExtractionStatus::AVAILABLE; }

    static std::string statusName(AudioExtractionStatus status);
};

/**
 * @brief Open decoding session on one media file
 *
 * Owns its decoder handles; they are released when the reader is destroyed.
 */
class FrameReader
{
public:
    virtual ~FrameReader() = default;

    /**
     * @brief Decode the frame displayed at a timestamp
     * @param seconds Position in the artifact; positions past the end yield the last frame
     * @return BGR image, or an empty cv::Mat if nothing could be decoded
     */
    virtual cv::Mat readFrameAt(double seconds) = 0;
};

/**
 * @brief Video-frame decoding capability
 */
class FrameDecoder
{
public:
    virtual ~FrameDecoder() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Read stream timing without decoding frames
     * @return Stream info, or std::nullopt if the file has no decodable video stream
     */
    virtual std::optional<VideoStreamInfo> probe(const std::string &file_path) const = 0;

    /**
     * @brief Open a reader producing frames scaled down to at most target_width pixels wide
     * @return Reader, or nullptr if the file cannot be decoded
     */
    virtual std::unique_ptr<FrameReader> openReader(const std::string &file_path, int target_width) const = 0;
};

/**
 * @brief Audio decoding capability
 */
class AudioDecoder
{
public:
    virtual ~AudioDecoder() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Decode the best audio stream into a mono series at target_sample_rate
     * @param token Optional cancellation flag polled between packets
     * @throws ValidationCancelledError if the token is triggered
     */
    virtual AudioExtraction decode(const std::string &file_path, int target_sample_rate,
                                   const CancellationToken *token) const = 0;
};

/**
 * @brief Stand-in used when video decoding is disabled or not built in
 */
class UnavailableFrameDecoder : public FrameDecoder
{
public:
    bool isAvailable() const override { return false; }
    std::optional<VideoStreamInfo> probe(const std::string &) const override { return std::nullopt; }
    std::unique_ptr<FrameReader> openReader(const std::string &, int) const override { return nullptr; }
};

/**
 * @brief Stand-in used when audio decoding is disabled or not built in
 */
class UnavailableAudioDecoder : public AudioDecoder
{
public:
    bool isAvailable() const override { return false; }
    AudioExtraction decode(const std::string &, int, const CancellationToken *) const override
    {
        return AudioExtraction(AudioExtractionStatus::DECODER_UNAVAILABLE, "audio decoding capability disabled");
    }
};

/**
 * @brief Capability providers selected once at validator construction
 */
struct MediaCapabilities
{
    std::shared_ptr<const FrameDecoder> frames;
    std::shared_ptr<const AudioDecoder> audio;

    /**
     * @brief FFmpeg-backed providers for enabled capabilities, stubs for disabled ones
     */
    static MediaCapabilities fromConfig(const CapabilityConfig &config);
};
