#ifndef SHIELDPAY_TX_TRANSACTOR_H_INCLUDED
#define SHIELDPAY_TX_TRANSACTOR_H_INCLUDED

#include <libshieldpay/tx/ApplyContext.h>
#include <libshieldpay/zkp/PublicSignals.h>

#include <xrpl/basics/Expected.h>

namespace shieldpay {

/** Base of the shielded operations.

    Each operation is checked in three stages:

    - preflight: the call on its own (sizes, tags, amounts),
    - preclaim: the call against a read-only view (proof, state sync),
    - doApply: mutation of a sandbox, committed only if it succeeds.

    Derived classes provide static preflight and preclaim functions and
    override doApply.
*/
class Transactor
{
public:
    virtual ~Transactor() = default;

    Transactor(Transactor const&) = delete;
    Transactor&
    operator=(Transactor const&) = delete;

    /** Run doApply. Exceptions become tecINTERNAL. */
    TER
    operator()();

    /** Decode the call's public signals using the circuit's arity. */
    static ripple::Expected<zkp::PublicSignals, TER>
    decodeSignals(ShieldedTx const& tx, zkp::ProofVerifier const& verifier);

    /** Checks every operation shares: proof size, signal count and that
        the caller's tag equals the signal at `tagIndex`. */
    static TER
    preflight1(PreflightContext const& ctx, std::size_t tagIndex);

    /** Verify the proof. Any failure is tefBAD_PROOF. */
    static TER
    checkProof(PreclaimContext const& ctx);

protected:
    explicit Transactor(ApplyContext& ctx);

    virtual TER
    doApply() = 0;

    ApplyView&
    view()
    {
        return ctx_.view();
    }

    /** The call's signals; preflight has already validated them. */
    zkp::PublicSignals const&
    signals() const
    {
        return signals_;
    }

    ApplyContext& ctx_;
    beast::Journal const j_;

private:
    zkp::PublicSignals signals_;
};

}  // namespace shieldpay

#endif
