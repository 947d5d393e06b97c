#ifndef SHIELDPAY_TX_SHIELDEDDEPOSIT_H_INCLUDED
#define SHIELDPAY_TX_SHIELDEDDEPOSIT_H_INCLUDED

#include <libshieldpay/tx/Receipts.h>
#include <libshieldpay/tx/Transactor.h>

namespace shieldpay {

/**
 * ShieldedDeposit
 *
 * Appends one note commitment to the tree for value paid into the vault.
 *
 * The proof's public signals carry the new commitment, the owner tag, the
 * root before and after the append, the next leaf index, the amount and
 * the deposit hash. The deposit is accepted only if
 * - the proof verifies,
 * - the same atomic unit pays exactly `amount` into the vault and carries
 *   a memo with the deposit hash,
 * - the proof was built against the current root and index.
 *
 * A deposit hash is credited once; submitting it again is accepted and
 * changes nothing.
 */
class ShieldedDeposit : public Transactor
{
public:
    using Receipt = DepositReceipt;

    explicit ShieldedDeposit(ApplyContext& ctx) : Transactor(ctx)
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
