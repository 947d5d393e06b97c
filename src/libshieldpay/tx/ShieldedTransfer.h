#ifndef SHIELDPAY_TX_SHIELDEDTRANSFER_H_INCLUDED
#define SHIELDPAY_TX_SHIELDEDTRANSFER_H_INCLUDED

#include <libshieldpay/tx/Receipts.h>
#include <libshieldpay/tx/Transactor.h>

namespace shieldpay {

/** Spend one note and create two, entirely inside the pool.

    The spent root must be the current tree root; both output commitments
    are appended, so the tree advances by two leaves and both intermediate
    roots enter the root history.
*/
class ShieldedTransfer : public Transactor
{
public:
    using Receipt = TransferReceipt;

    explicit ShieldedTransfer(ApplyContext& ctx) : Transactor(ctx)
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
