#include "tracking/voice_assigner.hpp"

#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace skytraffic::tracking {

Md5Digest md5_digest(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("md5_digest: EVP_MD_CTX_new failed");
    }

    Md5Digest digest{};
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 ||
        len != digest.size()) {
        throw std::runtime_error("md5_digest: digest computation failed");
    }
    return digest;
}

VoiceAssigner::VoiceAssigner(std::vector<std::string> voices)
    : voices_(std::move(voices)) {
    if (voices_.empty()) {
        throw std::invalid_argument("VoiceAssigner requires at least one voice");
    }
}

size_t VoiceAssigner::index_for(const std::string& id) const {
    const Md5Digest digest = md5_digest(id);

    // 128-bit big-endian value mod n, one byte at a time
    const unsigned long long n = voices_.size();
    unsigned long long rem = 0;
    for (unsigned char byte : digest) {
        rem = (rem * 256ULL + byte) % n;
    }
    return static_cast<size_t>(rem);
}

const std::string& VoiceAssigner::assign(const std::string& id) const {
    return voices_[index_for(id)];
}

} // namespace skytraffic::tracking
