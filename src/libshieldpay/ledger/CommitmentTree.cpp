#include <libshieldpay/ledger/CommitmentTree.h>

#include <xrpl/basics/contract.h>

#include <limits>
#include <stdexcept>

namespace shieldpay {

CommitmentTree::CommitmentTree(uint256 const& genesisRoot, std::uint8_t depth)
    : root_(genesisRoot), depth_(depth)
{
    if (depth_ == 0 || depth_ > maxTreeDepth)
        ripple::Throw<std::invalid_argument>(
            "CommitmentTree: depth out of range");
}

TER
CommitmentTree::checkAppend(
    uint256 const& oldRoot,
    std::uint32_t claimedNextIndex,
    std::uint32_t leaves) const
{
    if (oldRoot != root_)
        return terOLD_ROOT_MISMATCH;

    std::uint64_t const next = std::uint64_t{nextIndex_} + leaves;
    if (next > std::numeric_limits<std::uint32_t>::max())
        return tecARITHMETIC;

    if (claimedNextIndex != next)
        return terLEAF_INDEX_MISMATCH;

    if (next > capacity())
        return tecTREE_FULL;

    return tesSUCCESS;
}

void
CommitmentTree::append(uint256 const& newRoot, std::uint32_t leaves)
{
    std::uint64_t const next = std::uint64_t{nextIndex_} + leaves;
    if (next > std::numeric_limits<std::uint32_t>::max() || next > capacity())
        ripple::Throw<std::overflow_error>("CommitmentTree::append overflow");

    root_ = newRoot;
    nextIndex_ = static_cast<std::uint32_t>(next);
}

void
CommitmentTree::serialize(ripple::Serializer& s) const
{
    s.addBitString(root_);
    s.add32(nextIndex_);
    s.add8(depth_);
}

CommitmentTree
CommitmentTree::deserialize(ripple::SerialIter& sit)
{
    auto const root = sit.getBitString<256>();
    auto const next = sit.get32();
    auto const depth = sit.get8();

    CommitmentTree tree(root, depth);
    if (next > tree.capacity())
        ripple::Throw<std::runtime_error>(
            "CommitmentTree: stored index exceeds capacity");
    tree.nextIndex_ = next;
    return tree;
}

std::optional<CommitmentTree>
readCommitmentTree(ReadView const& view)
{
    auto const sle = view.read(keylet::commitmentTree());
    if (!sle)
        return std::nullopt;

    ripple::SerialIter sit(sle->slice());
    return CommitmentTree::deserialize(sit);
}

void
writeCommitmentTree(ApplyView& view, CommitmentTree const& tree)
{
    ripple::Serializer s;
    tree.serialize(s);

    auto const k = keylet::commitmentTree();
    if (auto sle = view.peek(k))
    {
        sle->setData(s.peekData());
        view.update(sle);
    }
    else
    {
        view.insert(std::make_shared<StateEntry>(k, s.peekData()));
    }
}

}  // namespace shieldpay
