#ifndef SHIELDPAY_PROTOCOL_KEYLET_H_INCLUDED
#define SHIELDPAY_PROTOCOL_KEYLET_H_INCLUDED

#include <xrpl/basics/base_uint.h>

#include <cstdint>

namespace shieldpay {

using ripple::uint256;

/** Kinds of record the shielded pool keeps in the state store. */
enum LedgerEntryType : std::uint16_t {
    ltCOMMITMENT_TREE = 0x0054,  // 'T'
    ltROOT_CACHE = 0x0052,       // 'R'
    ltNULLIFIER = 0x004e,        // 'N'
    ltDEPOSIT_MARKER = 0x0044,   // 'D'
    ltPOOL_BALANCE = 0x0056,     // 'V'
};

/** A pair of key and type identifying a state record. */
struct Keylet
{
    uint256 key;
    LedgerEntryType type;

    Keylet(LedgerEntryType type_, uint256 const& key_) : key(key_), type(type_)
    {
    }

    /** Returns true if a record of type `t` may live at this key. */
    bool
    check(LedgerEntryType t) const
    {
        return t == type;
    }
};

namespace keylet {

/** The single commitment tree record. */
Keylet
commitmentTree() noexcept;

/** The single root history cache record. */
Keylet
rootCache() noexcept;

/** The consumption record of a nullifier. */
Keylet
nullifier(uint256 const& tag) noexcept;

/** The processed marker of a deposit hash. */
Keylet
depositMarker(uint256 const& depositHash) noexcept;

/** The single pool balance record. */
Keylet
poolBalance() noexcept;

}  // namespace keylet

}  // namespace shieldpay

#endif
