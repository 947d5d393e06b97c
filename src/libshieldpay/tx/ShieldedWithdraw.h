#ifndef SHIELDPAY_TX_SHIELDEDWITHDRAW_H_INCLUDED
#define SHIELDPAY_TX_SHIELDEDWITHDRAW_H_INCLUDED

#include <libshieldpay/tx/Receipts.h>
#include <libshieldpay/tx/Transactor.h>

namespace shieldpay {

/** Spend one note and pay its value out of the vault.

    The proof may reference any root still in the root history. The tree
    itself does not change; only the nullifier is recorded.
*/
class ShieldedWithdraw : public Transactor
{
public:
    using Receipt = WithdrawReceipt;

    explicit ShieldedWithdraw(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static TER
    preflight(PreflightContext const& ctx);

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;

    Receipt const&
    receipt() const
    {
        return receipt_;
    }

private:
    Receipt receipt_;
};

}  // namespace shieldpay

#endif
