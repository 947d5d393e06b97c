#ifndef SHIELDPAY_TX_DEPOSITBINDING_H_INCLUDED
#define SHIELDPAY_TX_DEPOSITBINDING_H_INCLUDED

#include <libshieldpay/protocol/TER.h>
#include <libshieldpay/tx/Bundle.h>

#include <xrpl/basics/base_uint.h>
#include <xrpl/beast/utility/Journal.h>

#include <string>

namespace shieldpay {

using ripple::uint256;

/** Require a value transfer into `vault` in the same atomic unit.

    A transfer or checked transfer to `vault` for exactly `amount` must be
    visible in the bundle. When `allowWildcard` is set, an `amount` of zero
    accepts a transfer of any size.

    @return tesSUCCESS or tecMISSING_COMPANION_TRANSFER.
*/
TER
assertCompanionTransfer(
    BundleInspector const& bundle,
    AccountID const& vault,
    std::uint64_t amount,
    bool allowWildcard,
    beast::Journal j);

/** Require a memo naming the deposit hash in the same atomic unit.

    The memo payload is either the 32 hash bytes exactly as they appear in
    the public signals, or the text "deposit:" followed by those bytes in
    lowercase hex.

    @return tesSUCCESS or tecMISSING_MEMO.
*/
TER
assertCompanionMemo(
    BundleInspector const& bundle,
    uint256 const& depositHash,
    beast::Journal j);

/** The text form of a deposit memo. */
std::string
depositMemoText(uint256 const& depositHash);

}  // namespace shieldpay

#endif
