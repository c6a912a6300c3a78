#pragma once

#include "causal/Digest.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace causal {

struct MerkleProof {
    std::size_t index = 0;
    Digest leaf{};
    std::vector<Digest> siblings;
};

// Leaves and interior nodes are domain-separated; a level with an odd number
// of nodes pairs its last node with itself. The root of no leaves is zero.
Digest MerkleLeaf(const Digest& eventHash);
Digest ComputeMerkleRoot(const std::vector<Digest>& eventHashes);

std::optional<MerkleProof> ProveInclusion(const std::vector<Digest>& eventHashes, std::size_t index);
bool VerifyInclusion(const Digest& root, const MerkleProof& proof);

} // namespace causal
