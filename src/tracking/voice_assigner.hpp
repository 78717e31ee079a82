/**
 * VoiceAssigner — Stable callsign → TTS voice mapping.
 *
 * MD5 of the callsign bytes, read as a 128-bit big-endian integer,
 * modulo the pool size. No seeding, so a callsign maps to the same
 * voice in every process and every run.
 */

#ifndef SKYTRAFFIC_TRACKING_VOICE_ASSIGNER_HPP
#define SKYTRAFFIC_TRACKING_VOICE_ASSIGNER_HPP

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace skytraffic::tracking {

using Md5Digest = std::array<unsigned char, 16>;

/// MD5 via OpenSSL EVP. Throws std::runtime_error if the digest fails.
Md5Digest md5_digest(const std::string& data);

class VoiceAssigner {
public:
    /// @throws std::invalid_argument if the pool is empty
    explicit VoiceAssigner(std::vector<std::string> voices);

    const std::string& assign(const std::string& id) const;

    /// Pool index for an id; exposed for distribution checks.
    size_t index_for(const std::string& id) const;

    const std::vector<std::string>& voices() const { return voices_; }

private:
    std::vector<std::string> voices_;
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_VOICE_ASSIGNER_HPP
