#ifndef SHIELDPAY_TX_APPLYCONTEXT_H_INCLUDED
#define SHIELDPAY_TX_APPLYCONTEXT_H_INCLUDED

#include <libshieldpay/core/PoolConfig.h>
#include <libshieldpay/ledger/ReadView.h>
#include <libshieldpay/tx/Bundle.h>
#include <libshieldpay/tx/ValueMover.h>
#include <libshieldpay/zkp/ProofVerifier.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/beast/utility/Journal.h>

#include <optional>

namespace shieldpay {

/** A shielded call as submitted by a client. */
struct ShieldedTx
{
    zkp::Circuit circuit;

    /** Deposit hash for deposits, nullifier otherwise. Must equal the
        corresponding public signal. */
    uint256 tag;

    Blob proof;
    Blob publicSignals;

    /** Account a withdrawal pays. */
    std::optional<AccountID> recipient;
};

/** State a preflight check may use: the call and fixed settings only. */
struct PreflightContext
{
    ShieldedTx const& tx;
    zkp::ProofVerifier const& verifier;
    PoolConfig const& config;
    beast::Journal const j;
};

/** State a preclaim check may use: adds a read-only view and the bundle. */
struct PreclaimContext
{
    ReadView const& view;
    ShieldedTx const& tx;
    zkp::ProofVerifier const& verifier;
    PoolConfig const& config;
    BundleInspector const* bundle;
    beast::Journal const j;
};

/** Everything doApply touches. The view is a sandbox. */
class ApplyContext
{
public:
    ApplyContext(
        ApplyView& view,
        ShieldedTx const& tx_,
        zkp::ProofVerifier const& verifier_,
        PoolConfig const& config_,
        ValueMover& mover_,
        beast::Journal journal_)
        : tx(tx_)
        , verifier(verifier_)
        , config(config_)
        , mover(mover_)
        , journal(journal_)
        , view_(view)
    {
    }

    ShieldedTx const& tx;
    zkp::ProofVerifier const& verifier;
    PoolConfig const& config;
    ValueMover& mover;
    beast::Journal const journal;

    ApplyView&
    view()
    {
        return view_;
    }

private:
    ApplyView& view_;
};

}  // namespace shieldpay

#endif
