#ifndef SHIELDPAY_LEDGER_COMMITMENTTREE_H_INCLUDED
#define SHIELDPAY_LEDGER_COMMITMENTTREE_H_INCLUDED

#include <libshieldpay/ledger/ReadView.h>
#include <libshieldpay/protocol/TER.h>

#include <xrpl/protocol/Serializer.h>

#include <cstdint>
#include <optional>

namespace shieldpay {

constexpr std::uint8_t maxTreeDepth = 32;

/** The on-chain summary of the append-only commitment tree.

    Only the current root and the next free leaf index are kept. The tree's
    contents are never materialized here; the circuits prove that the new
    root follows from the old one.
*/
class CommitmentTree
{
public:
    CommitmentTree(uint256 const& genesisRoot, std::uint8_t depth);

    uint256 const&
    currentRoot() const
    {
        return root_;
    }

    std::uint32_t
    nextLeafIndex() const
    {
        return nextIndex_;
    }

    std::uint8_t
    depth() const
    {
        return depth_;
    }

    /** Number of leaves the tree can hold. */
    std::uint64_t
    capacity() const
    {
        return std::uint64_t{1} << depth_;
    }

    /** Check that a proof appending `leaves` leaves matches this state.

        The proof must have been built against the current root and must
        claim the index the tree will have after the append.
    */
    TER
    checkAppend(
        uint256 const& oldRoot,
        std::uint32_t claimedNextIndex,
        std::uint32_t leaves) const;

    /** Move to `newRoot` and advance the index. checkAppend must pass. */
    void
    append(uint256 const& newRoot, std::uint32_t leaves);

    void
    serialize(ripple::Serializer& s) const;

    static CommitmentTree
    deserialize(ripple::SerialIter& sit);

private:
    uint256 root_;
    std::uint32_t nextIndex_ = 0;
    std::uint8_t depth_;
};

/** Load the tree record, or nullopt if the pool was never initialized. */
std::optional<CommitmentTree>
readCommitmentTree(ReadView const& view);

/** Store the tree record, creating it on first write. */
void
writeCommitmentTree(ApplyView& view, CommitmentTree const& tree);

}  // namespace shieldpay

#endif
