#include "causal/Merkle.hpp"

namespace causal {

namespace {

constexpr uint8_t kLeafTag = 0x00;
constexpr uint8_t kNodeTag = 0x01;

Digest HashPair(const Digest& left, const Digest& right) {
    Sha3Hasher hasher;
    hasher.UpdateU8(kNodeTag).Update(left).Update(right);
    return hasher.Finalize();
}

std::vector<Digest> NextLevel(const std::vector<Digest>& level) {
    std::vector<Digest> next;
    next.reserve((level.size() + 1) / 2);
    for (std::size_t i = 0; i < level.size(); i += 2) {
        const auto& left = level[i];
        const auto& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
        next.push_back(HashPair(left, right));
    }
    return next;
}

std::vector<Digest> Leaves(const std::vector<Digest>& eventHashes) {
    std::vector<Digest> leaves;
    leaves.reserve(eventHashes.size());
    for (const auto& hash : eventHashes) {
        leaves.push_back(MerkleLeaf(hash));
    }
    return leaves;
}

} // namespace

Digest MerkleLeaf(const Digest& eventHash) {
    Sha3Hasher hasher;
    hasher.UpdateU8(kLeafTag).Update(eventHash);
    return hasher.Finalize();
}

Digest ComputeMerkleRoot(const std::vector<Digest>& eventHashes) {
    if (eventHashes.empty()) {
        return Digest{};
    }

    auto level = Leaves(eventHashes);
    while (level.size() > 1) {
        level = NextLevel(level);
    }
    return level.front();
}

std::optional<MerkleProof> ProveInclusion(const std::vector<Digest>& eventHashes, std::size_t index) {
    if (index >= eventHashes.size()) {
        return std::nullopt;
    }

    MerkleProof proof;
    proof.index = index;
    proof.leaf = MerkleLeaf(eventHashes[index]);

    auto level = Leaves(eventHashes);
    auto position = index;
    while (level.size() > 1) {
        auto siblingPosition = (position % 2 == 0) ? position + 1 : position - 1;
        if (siblingPosition >= level.size()) {
            siblingPosition = position;
        }
        proof.siblings.push_back(level[siblingPosition]);

        level = NextLevel(level);
        position /= 2;
    }

    return proof;
}

bool VerifyInclusion(const Digest& root, const MerkleProof& proof) {
    auto current = proof.leaf;
    auto position = proof.index;
    for (const auto& sibling : proof.siblings) {
        current = (position % 2 == 0) ? HashPair(current, sibling) : HashPair(sibling, current);
        position /= 2;
    }

    return position == 0 && DigestEquals(current, root);
}

} // namespace causal
