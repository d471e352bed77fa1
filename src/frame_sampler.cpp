#include "core/frame_sampler.hpp"
#include "logging/logger.hpp"
#include <utility>

FrameSequence::FrameSequence() : index_(0), token_(nullptr)
{
}

FrameSequence::FrameSequence(std::unique_ptr<FrameReader> reader, std::vector<double> timestamps,
                             const CancellationToken *token)
    : reader_(std::move(reader)), timestamps_(std::move(timestamps)), index_(0), token_(token)
{
}

bool FrameSequence::next(SampledFrame &frame)
{
    while (reader_ && index_ < timestamps_.size())
    {
        if (token_)
        {
            token_->throwIfCancelled("frame sampling");
        }
        double t = timestamps_[index_++];
        cv::Mat image = reader_->readFrameAt(t);
        if (image.empty())
        {
            Logger::debug("Skipping undecodable frame at " + std::to_string(t) + "s");
            continue;
        }
        frame = SampledFrame(t, image);
        return true;
    }
    reader_.reset();
    return false;
}

std::vector<SampledFrame> FrameSequence::collect()
{
    std::vector<SampledFrame> frames;
    SampledFrame frame;
    while (next(frame))
    {
        frames.push_back(frame);
    }
    return frames;
}

FrameSampler::FrameSampler(std::shared_ptr<const FrameDecoder> decoder, int analysis_width)
    : decoder_(std::move(decoder)), analysis_width_(analysis_width)
{
}

FrameSequence FrameSampler::sample(const std::string &file_path, int sample_count,
                                   const CancellationToken *token) const
{
    if (!decoder_ || !decoder_->isAvailable() || sample_count < 1)
    {
        return FrameSequence();
    }

    auto info = decoder_->probe(file_path);
    if (!info)
    {
        Logger::warn("No decodable video stream in " + file_path + ", frame sampling skipped");
        return FrameSequence();
    }

    std::unique_ptr<FrameReader> reader = decoder_->openReader(file_path, analysis_width_);
    if (!reader)
    {
        Logger::warn("Could not open video decoder for " + file_path + ", frame sampling skipped");
        return FrameSequence();
    }

    std::vector<double> timestamps = sampleTimestamps(info->duration_seconds, sample_count);
    Logger::debug("Sampling " + std::to_string(timestamps.size()) + " frames over " +
                  std::to_string(info->duration_seconds) + "s of " + file_path);
    return FrameSequence(std::move(reader), std::move(timestamps), token);
}

std::vector<double> FrameSampler::sampleTimestamps(double duration_seconds, int sample_count)
{
    std::vector<double> timestamps;
    if (sample_count < 1)
    {
        return timestamps;
    }
    if (sample_count == 1 || duration_seconds <= 0.0)
    {
        timestamps.push_back(0.0);
        return timestamps;
    }
    timestamps.reserve(sample_count);
    for (int i = 0; i < sample_count; ++i)
    {
        timestamps.push_back(duration_seconds * i / (sample_count - 1));
    }
    return timestamps;
}
