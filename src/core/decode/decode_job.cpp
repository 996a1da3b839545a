/// @file decode_job.cpp
/// @brief Default decode function

#include "decode_job.hpp"

namespace lumen::decode {

DecodeResult runDecodeJob(const DecodeJob& job) {
    image::Decoder decoder;

    if (job.mode == DecodeMode::Thumbnail) {
        auto encoded = decoder.decodeToEncodedBytes(job.path, job.target);
        if (!encoded) {
            return std::unexpected(encoded.error());
        }
        return DecodeOutput(std::move(*encoded));
    }

    auto pixels = decoder.decode(job.path, job.target);
    if (!pixels) {
        return std::unexpected(pixels.error());
    }
    return DecodeOutput(std::move(*pixels));
}

}  // namespace lumen::decode
