#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/media_capabilities.hpp"

/**
 * @brief Lazy, finite sequence of sampled frames
 *
 * Frames are decoded one at a time by next(). The decoding session is
 * released as soon as the sequence is exhausted, or when the sequence is
 * destroyed, whichever comes first.
 */
class FrameSequence
{
public:
    FrameSequence();
    FrameSequence(std::unique_ptr<FrameReader> reader, std::vector<double> timestamps,
                  const CancellationToken *token);

    FrameSequence(FrameSequence &&) = default;
    FrameSequence &operator=(FrameSequence &&) = default;
    FrameSequence(const FrameSequence &) = delete;
    FrameSequence &operator=(const FrameSequence &) = delete;

    /**
     * @brief Decode the next planned frame
     * @param frame Receives the frame on success
     * @return false once every planned timestamp has been tried
     * @throws ValidationCancelledError if the token is triggered
     */
    bool next(SampledFrame &frame);

    /**
     * @brief Drain the remaining frames into a vector
     */
    std::vector<SampledFrame> collect();

    const std::vector<double> &plannedTimestamps() const { return timestamps_; }
    bool isOpen() const { return reader_ != nullptr; }

private:
    std::unique_ptr<FrameReader> reader_;
    std::vector<double> timestamps_;
    size_t index_;
    const CancellationToken *token_;
};

/**
 * @brief Extracts a bounded set of uniformly spaced frames from a video
 */
class FrameSampler
{
public:
    FrameSampler(std::shared_ptr<const FrameDecoder> decoder, int analysis_width);

    /**
     * @brief Plan and open a sampling session
     * @param sample_count Maximum number of frames N
     * @return Lazy sequence; empty when decoding is unavailable or the file has no video
     */
    FrameSequence sample(const std::string &file_path, int sample_count,
                         const CancellationToken *token = nullptr) const;

    /**
     * @brief Uniform timestamps i*D/(N-1); a single t=0 when N == 1 or D <= 0
     */
    static std::vector<double> sampleTimestamps(double duration_seconds, int sample_count);

private:
    std::shared_ptr<const FrameDecoder> decoder_;
    int analysis_width_;
};
