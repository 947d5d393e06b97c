#ifndef SHIELDPAY_LEDGER_STATEENTRY_H_INCLUDED
#define SHIELDPAY_LEDGER_STATEENTRY_H_INCLUDED

#include <libshieldpay/protocol/Keylet.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Slice.h>

#include <cstdint>
#include <memory>

namespace shieldpay {

using ripple::Blob;
using ripple::Slice;

/** One named record in the state store.

    The payload is opaque to the store; each record kind serializes itself.
    The version counts committed writes and is maintained by the store.
*/
class StateEntry
{
public:
    StateEntry(Keylet const& k, Blob data)
        : key_(k.key), type_(k.type), data_(std::move(data))
    {
    }

    uint256 const&
    key() const
    {
        return key_;
    }

    LedgerEntryType
    getType() const
    {
        return type_;
    }

    std::uint32_t
    version() const
    {
        return version_;
    }

    void
    setVersion(std::uint32_t v)
    {
        version_ = v;
    }

    Slice
    slice() const
    {
        return ripple::makeSlice(data_);
    }

    void
    setData(Blob data)
    {
        data_ = std::move(data);
    }

private:
    uint256 key_;
    LedgerEntryType type_;
    std::uint32_t version_ = 0;
    Blob data_;
};

}  // namespace shieldpay

#endif
