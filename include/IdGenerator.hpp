#ifndef LANTEXT_ID_GENERATOR_HPP
#define LANTEXT_ID_GENERATOR_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace lantext {

/**
 * Random identifiers for peers and file transfers, drawn from libsodium's CSPRNG.
 */
class IdGenerator {
public:
    /// Initializes libsodium. Safe to call repeatedly; returns false if the library is unusable.
    static bool initialize();

    /// Short token used when no peer id is configured (8 hex characters).
    static std::string generatePeerId();

    /// Unique id for one file transfer (32 hex characters).
    static std::string generateFileId();

    /// `byteCount` random bytes, hex encoded. Throws std::runtime_error if libsodium fails.
    static std::string randomToken(size_t byteCount);

    static std::string hexEncode(const std::vector<uint8_t>& data);
};

} // namespace lantext

#endif // LANTEXT_ID_GENERATOR_HPP
