#include "causal/Digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace causal {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

void Sha3Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const { EVP_MD_CTX_free(ctx); }

Sha3Hasher::Sha3Hasher()
    : ctx_{EVP_MD_CTX_new()} {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha3Hasher::~Sha3Hasher() = default;

Sha3Hasher& Sha3Hasher::Update(const uint8_t* data, std::size_t length) {
    if (finalized_) {
        throw std::logic_error("hasher already finalized");
    }
    if (length > 0 && EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Sha3Hasher& Sha3Hasher::Update(const Digest& digest) { return Update(digest.data(), digest.size()); }

Sha3Hasher& Sha3Hasher::Update(const std::string& text) {
    UpdateU64(static_cast<uint64_t>(text.size()));
    return Update(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Sha3Hasher& Sha3Hasher::UpdateU64(uint64_t value) {
    uint8_t bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return Update(bytes, sizeof(bytes));
}

Sha3Hasher& Sha3Hasher::UpdateU16(uint16_t value) {
    uint8_t bytes[2] = {static_cast<uint8_t>(value), static_cast<uint8_t>(value >> 8)};
    return Update(bytes, sizeof(bytes));
}

Sha3Hasher& Sha3Hasher::UpdateU8(uint8_t value) { return Update(&value, 1); }

Digest Sha3Hasher::Finalize() {
    if (finalized_) {
        throw std::logic_error("hasher already finalized");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLength = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &outLength) != 1 || outLength != Digest{}.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finalized_ = true;

    Digest digest;
    std::copy(out, out + digest.size(), digest.begin());
    return digest;
}

Digest HashBytes(const uint8_t* data, std::size_t length) {
    Sha3Hasher hasher;
    hasher.Update(data, length);
    return hasher.Finalize();
}

Digest HashBytes(const std::vector<uint8_t>& data) { return HashBytes(data.data(), data.size()); }

bool IsZero(const Digest& digest) {
    uint8_t accumulated = 0;
    for (auto byte : digest) {
        accumulated |= byte;
    }
    return accumulated == 0;
}

bool DigestEquals(const Digest& lhs, const Digest& rhs) {
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

std::string ToHex(const uint8_t* data, std::size_t length) {
    static const char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

std::string ToHex(const Digest& digest) { return ToHex(digest.data(), digest.size()); }

std::vector<uint8_t> BytesFromHex(const std::string& hex) {
    std::size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }

    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve((hex.size() - start) / 2);
    for (std::size_t i = start; i < hex.size(); i += 2) {
        int high = HexValue(hex[i]);
        int low = HexValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("invalid hex character");
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return bytes;
}

Digest DigestFromHex(const std::string& hex) {
    auto bytes = BytesFromHex(hex);
    if (bytes.size() != Digest{}.size()) {
        throw std::invalid_argument("digest must be 32 bytes (64 hex characters)");
    }
    return DigestFromBlob(bytes);
}

Digest DigestFromBlob(const std::vector<uint8_t>& blob) {
    Digest digest{};
    if (blob.size() != digest.size()) {
        throw std::invalid_argument("stored digest has wrong length");
    }
    std::copy(blob.begin(), blob.end(), digest.begin());
    return digest;
}

} // namespace causal
