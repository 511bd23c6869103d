#include "IdGenerator.hpp"
#include "Types.hpp"

#include <sodium.h>
#include <iostream>
#include <stdexcept>

namespace lantext {

bool IdGenerator::initialize() {
    // sodium_init returns 1 when already initialized
    if (sodium_init() < 0) {
        std::cerr << "ERROR: Failed to initialize libsodium" << std::endl;
        return false;
    }

    return true;
}

std::string IdGenerator::generatePeerId() {
    return randomToken(PEER_ID_BYTES);
}

std::string IdGenerator::generateFileId() {
    return randomToken(FILE_ID_BYTES);
}

std::string IdGenerator::randomToken(size_t byteCount) {
    if (byteCount == 0) {
        return "";
    }

    if (!initialize()) {
        throw std::runtime_error("libsodium not available for random id generation");
    }

    std::vector<uint8_t> bytes(byteCount);
    randombytes_buf(bytes.data(), bytes.size());

    return hexEncode(bytes);
}

std::string IdGenerator::hexEncode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";

    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);

    return hex;
}

} // namespace lantext
