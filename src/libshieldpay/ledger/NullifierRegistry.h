#ifndef SHIELDPAY_LEDGER_NULLIFIERREGISTRY_H_INCLUDED
#define SHIELDPAY_LEDGER_NULLIFIERREGISTRY_H_INCLUDED

#include <libshieldpay/ledger/ReadView.h>
#include <libshieldpay/protocol/TER.h>

#include <xrpl/beast/utility/Journal.h>

namespace shieldpay {

/** Records which nullifiers have been spent.

    One record per nullifier, created on first use and never removed.
    Checking and marking happen in a single call so that two operations
    spending the same note cannot both pass the check.
*/
class NullifierRegistry
{
public:
    NullifierRegistry(ApplyView& view, beast::Journal j) : view_(view), j_(j)
    {
    }

    /** Mark a nullifier spent.

        @return tesSUCCESS the first time, tecNULLIFIER_USED afterwards.
    */
    TER
    consume(uint256 const& tag);

private:
    ApplyView& view_;
    beast::Journal const j_;
};

/** True if the nullifier has been spent. For queries, not for gating. */
bool
isNullifierConsumed(ReadView const& view, uint256 const& tag);

}  // namespace shieldpay

#endif
