#include <libshieldpay/ledger/RootHistoryCache.h>

#include <xrpl/basics/contract.h>

#include <algorithm>
#include <stdexcept>

namespace shieldpay {

RootHistoryCache::RootHistoryCache(std::uint32_t capacity)
{
    if (capacity == 0 || capacity > maxRootCacheCapacity)
        ripple::Throw<std::invalid_argument>(
            "RootHistoryCache: capacity out of range");
    slots_.resize(capacity);
}

void
RootHistoryCache::insert(uint256 const& root)
{
    if (contains(root))
        return;

    slots_[cursor_] = root;
    cursor_ = (cursor_ + 1) % capacity();
    if (count_ < capacity())
        ++count_;
}

bool
RootHistoryCache::contains(uint256 const& root) const
{
    // Unused slots are never scanned, so a zero root is not found by accident.
    if (count_ < capacity())
        return std::find(slots_.begin(), slots_.begin() + count_, root) !=
            slots_.begin() + count_;
    return std::find(slots_.begin(), slots_.end(), root) != slots_.end();
}

std::vector<uint256>
RootHistoryCache::roots() const
{
    std::vector<uint256> out;
    out.reserve(count_);

    std::uint32_t const first = count_ < capacity() ? 0 : cursor_;
    for (std::uint32_t i = 0; i < count_; ++i)
        out.push_back(slots_[(first + i) % capacity()]);
    return out;
}

void
RootHistoryCache::serialize(ripple::Serializer& s) const
{
    s.add32(capacity());
    s.add32(cursor_);
    s.add32(count_);
    for (auto const& root : slots_)
        s.addBitString(root);
}

RootHistoryCache
RootHistoryCache::deserialize(ripple::SerialIter& sit)
{
    auto const capacity = sit.get32();
    RootHistoryCache cache(capacity);

    cache.cursor_ = sit.get32();
    cache.count_ = sit.get32();
    if (cache.cursor_ >= capacity || cache.count_ > capacity)
        ripple::Throw<std::runtime_error>(
            "RootHistoryCache: corrupt cursor or count");

    for (auto& root : cache.slots_)
        root = sit.getBitString<256>();

    return cache;
}

std::optional<RootHistoryCache>
readRootCache(ReadView const& view)
{
    auto const sle = view.read(keylet::rootCache());
    if (!sle)
        return std::nullopt;

    ripple::SerialIter sit(sle->slice());
    return RootHistoryCache::deserialize(sit);
}

void
writeRootCache(ApplyView& view, RootHistoryCache const& cache)
{
    ripple::Serializer s;
    cache.serialize(s);

    auto const k = keylet::rootCache();
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
