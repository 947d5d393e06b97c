#ifndef SHIELDPAY_TX_APPLYSTEPS_H_INCLUDED
#define SHIELDPAY_TX_APPLYSTEPS_H_INCLUDED

#include <libshieldpay/ledger/Sandbox.h>
#include <libshieldpay/tx/ApplyContext.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/basics/Log.h>

namespace shieldpay {

/** Run one shielded operation through preflight, preclaim and doApply.

    The first failing stage ends the call. doApply runs in a sandbox over
    `view` that is committed only when it succeeds, so on any failure
    `view` is unchanged.

    @tparam T ShieldedDeposit, ShieldedTransfer or ShieldedWithdraw.
*/
template <class T>
ripple::Expected<typename T::Receipt, TER>
applyShielded(
    ApplyView& view,
    ShieldedTx const& tx,
    zkp::ProofVerifier const& verifier,
    PoolConfig const& config,
    BundleInspector const* bundle,
    ValueMover& mover,
    beast::Journal j)
{
    PreflightContext const pfctx{tx, verifier, config, j};
    if (auto const ret = T::preflight(pfctx); !isTesSuccess(ret))
    {
        JLOG(j.debug()) << zkp::to_string(tx.circuit)
                        << " preflight: " << transToken(ret);
        return ripple::Unexpected(ret);
    }

    PreclaimContext const pcctx{view, tx, verifier, config, bundle, j};
    if (auto const ret = T::preclaim(pcctx); !isTesSuccess(ret))
    {
        JLOG(j.debug()) << zkp::to_string(tx.circuit)
                        << " preclaim: " << transToken(ret);
        return ripple::Unexpected(ret);
    }

    Sandbox sb(view);
    ApplyContext actx(sb, tx, verifier, config, mover, j);
    T op(actx);

    if (auto const ret = op(); !isTesSuccess(ret))
    {
        JLOG(j.warn()) << zkp::to_string(tx.circuit)
                       << " not applied: " << transToken(ret);
        return ripple::Unexpected(ret);
    }

    sb.apply();
    return op.receipt();
}

}  // namespace shieldpay

#endif
