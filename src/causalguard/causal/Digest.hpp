#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace causal {

using Digest = std::array<uint8_t, 32>;

struct DigestHash {
    std::size_t operator()(const Digest& digest) const {
        std::size_t value = 0;
        for (std::size_t i = 0; i < sizeof(value); ++i) {
            value = (value << 8) | digest[i];
        }
        return value;
    }
};

// Incremental SHA3-256. Integers are absorbed little-endian, strings are
// length-prefixed so that adjacent fields cannot be shifted into each other.
class Sha3Hasher {
public:
    Sha3Hasher();
    ~Sha3Hasher();

    Sha3Hasher(const Sha3Hasher&) = delete;
    Sha3Hasher& operator=(const Sha3Hasher&) = delete;

    Sha3Hasher& Update(const uint8_t* data, std::size_t length);
    Sha3Hasher& Update(const Digest& digest);
    Sha3Hasher& Update(const std::string& text);
    Sha3Hasher& UpdateU64(uint64_t value);
    Sha3Hasher& UpdateU16(uint16_t value);
    Sha3Hasher& UpdateU8(uint8_t value);

    Digest Finalize();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_ = false;
};

Digest HashBytes(const uint8_t* data, std::size_t length);
Digest HashBytes(const std::vector<uint8_t>& data);

bool IsZero(const Digest& digest);

// Constant-time equality.
bool DigestEquals(const Digest& lhs, const Digest& rhs);

std::string ToHex(const Digest& digest);
std::string ToHex(const uint8_t* data, std::size_t length);

// Accepts an optional 0x prefix. Throws std::invalid_argument on malformed input.
std::vector<uint8_t> BytesFromHex(const std::string& hex);
Digest DigestFromHex(const std::string& hex);

Digest DigestFromBlob(const std::vector<uint8_t>& blob);

} // namespace causal
