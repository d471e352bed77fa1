#pragma once

#include "core/media_capabilities.hpp"

/**
 * @brief Video frame decoding through libavformat/libavcodec/libswscale
 *
 * Stateless; each reader owns its own demuxer and decoder, so one instance
 * may serve concurrent validation runs.
 */
class FFmpegFrameDecoder : public FrameDecoder
{
public:
    bool isAvailable() const override { return true; }
    std::optional<VideoStreamInfo> probe(const std::string &file_path) const override;
    std::unique_ptr<FrameReader> openReader(const std::string &file_path, int target_width) const override;
};

/**
 * @brief Audio decoding through libavformat/libavcodec/libswresample
 *
 * Channels are resampled to the target rate as planar float and averaged
 * into a single mono series.
 */
class FFmpegAudioDecoder : public AudioDecoder
{
public:
    bool isAvailable() const override { return true; }
    AudioExtraction decode(const std::string &file_path, int target_sample_rate,
                           const CancellationToken *token) const override;
};
