#pragma once

#include <memory>
#include <string>
#include "core/media_capabilities.hpp"

/**
 * @brief Decodes the audio track of an artifact into a mono amplitude series
 *
 * Never throws for decoding problems: a missing decoder, a missing track and
 * a broken track are reported through AudioExtraction::status. Only
 * cancellation escapes as ValidationCancelledError.
 */
class AudioExtractor
{
public:
    AudioExtractor(std::shared_ptr<const AudioDecoder> decoder, int sample_rate);

    AudioExtraction extract(const std::string &file_path, const CancellationToken *token = nullptr) const;

private:
    std::shared_ptr<const AudioDecoder> decoder_;
    int sample_rate_;
};
