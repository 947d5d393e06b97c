#pragma once

#include <libshieldpay/protocol/TER.h>
#include <libshieldpay/zkp/WireCodec.h>

#include <xrpl/protocol/AccountID.h>

#include <cstdint>
#include <vector>

namespace shieldpay {
namespace zkp {

/** The decoded public signals of one proof.

    Values stay in wire form (32 little-endian bytes each); they are only
    compared for equality with state, except for the integer signals which
    are read through asU32 / asU64.
*/
class PublicSignals
{
public:
    PublicSignals() = default;

    explicit PublicSignals(std::vector<uint256> values)
        : values_(std::move(values))
    {
    }

    /** Decode `count` signals from their wire form. */
    static Expected<PublicSignals, TER>
    fromWire(Slice bytes, std::size_t count);

    std::size_t
    size() const
    {
        return values_.size();
    }

    uint256 const&
    operator[](std::size_t index) const
    {
        return values_[index];
    }

    std::vector<uint256> const&
    values() const
    {
        return values_;
    }

    /** Read a little-endian integer signal that must fit in 32 bits. */
    Expected<std::uint32_t, TER>
    asU32(std::size_t index) const;

    /** Read a little-endian integer signal that must fit in 64 bits. */
    Expected<std::uint64_t, TER>
    asU64(std::size_t index) const;

private:
    std::vector<uint256> values_;
};

/** Wire form of a small integer signal. */
uint256
signalFromInt(std::uint64_t value);

/** Wire form of an account: its 160-bit value as a little-endian field
    element, so byte 0 of the signal is the last byte of the account. */
uint256
signalFromAccount(ripple::AccountID const& account);

}  // namespace zkp
}  // namespace shieldpay
