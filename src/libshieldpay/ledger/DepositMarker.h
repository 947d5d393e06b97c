#ifndef SHIELDPAY_LEDGER_DEPOSITMARKER_H_INCLUDED
#define SHIELDPAY_LEDGER_DEPOSITMARKER_H_INCLUDED

#include <libshieldpay/ledger/ReadView.h>
#include <libshieldpay/protocol/TER.h>

namespace shieldpay {

// Deposit hashes that have already been credited to the tree.

bool
isDepositProcessed(ReadView const& view, uint256 const& depositHash);

/** @return tecDUPLICATE if the hash was already marked. */
TER
markDepositProcessed(ApplyView& view, uint256 const& depositHash);

}  // namespace shieldpay

#endif
