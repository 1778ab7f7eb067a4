#include "job_id.h"
#include <openssl/rand.h>
#include <stdexcept>

namespace runbox {

std::string generate_job_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate random job id");
    }

    // RFC 4122: version 4, variant 10xx
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    static const char hex[] = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id += '-';
        }
        id += hex[bytes[i] >> 4];
        id += hex[bytes[i] & 0x0F];
    }
    return id;
}

bool is_valid_job_id(const std::string& id) {
    if (id.size() != 36) return false;

    for (size_t i = 0; i < id.size(); ++i) {
        char c = id[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    if (id[14] != '4') return false;
    char variant = id[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace runbox
