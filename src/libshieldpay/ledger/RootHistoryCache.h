#ifndef SHIELDPAY_LEDGER_ROOTHISTORYCACHE_H_INCLUDED
#define SHIELDPAY_LEDGER_ROOTHISTORYCACHE_H_INCLUDED

#include <libshieldpay/ledger/ReadView.h>

#include <xrpl/protocol/Serializer.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace shieldpay {

constexpr std::uint32_t defaultRootCacheCapacity = 1024;
constexpr std::uint32_t maxRootCacheCapacity = 4096;

/** Fixed-size window of recent commitment tree roots.

    A ring of `capacity` slots with a write cursor. When full, a new root
    overwrites the oldest one. A root that is already present is not
    inserted again, so the window never holds duplicates and a repeated
    root does not push out an older one.

    Withdrawals may reference any root in the window, which lets a proof
    built a few operations ago still be accepted.
*/
class RootHistoryCache
{
public:
    explicit RootHistoryCache(std::uint32_t capacity = defaultRootCacheCapacity);

    /** Record a root. No-op if the root is already present. */
    void
    insert(uint256 const& root);

    bool
    contains(uint256 const& root) const;

    std::uint32_t
    size() const
    {
        return count_;
    }

    std::uint32_t
    capacity() const
    {
        return static_cast<std::uint32_t>(slots_.size());
    }

    /** The roots currently held, oldest first. */
    std::vector<uint256>
    roots() const;

    void
    serialize(ripple::Serializer& s) const;

    static RootHistoryCache
    deserialize(ripple::SerialIter& sit);

private:
    std::vector<uint256> slots_;
    std::uint32_t cursor_ = 0;
    std::uint32_t count_ = 0;
};

std::optional<RootHistoryCache>
readRootCache(ReadView const& view);

void
writeRootCache(ApplyView& view, RootHistoryCache const& cache);

}  // namespace shieldpay

#endif
