#ifndef CHECKSUM_VERIFIER_HPP
#define CHECKSUM_VERIFIER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ChecksumResult {
    std::string raw_digest;     // sha256 of the bytes
    std::string base64_digest;  // sha256 of the base64 text of the bytes
    bool mismatch = false;
};

// Some clients hash the base64 string they uploaded rather than the decoded
// bytes, so a declared checksum is accepted if it equals either digest. An
// empty declared checksum is treated as none.
class ChecksumVerifier {
public:
    static ChecksumResult verify(const std::vector<uint8_t>& data,
                                 const std::optional<std::string>& declared);
};

#endif // CHECKSUM_VERIFIER_HPP
