#include "checksum_verifier.hpp"

#include "../utils/base64.hpp"
#include "../utils/digest.hpp"

ChecksumResult ChecksumVerifier::verify(const std::vector<uint8_t>& data,
                                        const std::optional<std::string>& declared) {
    ChecksumResult result;
    result.raw_digest = sha256Hex(data);
    result.base64_digest = sha256Hex(Base64::encode(data));

    if (!declared || declared->empty()) {
        return result;
    }

    // Exact match only: digests are lower-case hex and nothing is trimmed.
    result.mismatch = *declared != result.raw_digest &&
                      *declared != result.base64_digest;
    return result;
}
