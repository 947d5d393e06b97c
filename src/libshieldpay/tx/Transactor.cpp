#include <libshieldpay/tx/Transactor.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace shieldpay {

Transactor::Transactor(ApplyContext& ctx) : ctx_(ctx), j_(ctx.journal)
{
    auto decoded = decodeSignals(ctx_.tx, ctx_.verifier);
    if (!decoded)
        ripple::Throw<std::logic_error>(
            "Transactor: signals not validated by preflight");
    signals_ = std::move(*decoded);
}

ripple::Expected<zkp::PublicSignals, TER>
Transactor::decodeSignals(ShieldedTx const& tx, zkp::ProofVerifier const& verifier)
{
    return zkp::PublicSignals::fromWire(
        ripple::makeSlice(tx.publicSignals),
        verifier.publicInputCount(tx.circuit));
}

TER
Transactor::preflight1(PreflightContext const& ctx, std::size_t tagIndex)
{
    if (ctx.tx.proof.size() != zkp::proofBytes)
    {
        JLOG(ctx.j.debug()) << "Bad proof length: " << ctx.tx.proof.size();
        return temBAD_PROOF_LENGTH;
    }

    auto const signals = decodeSignals(ctx.tx, ctx.verifier);
    if (!signals)
    {
        JLOG(ctx.j.debug()) << "Bad public signals length: "
                            << ctx.tx.publicSignals.size();
        return signals.error();
    }

    if ((*signals)[tagIndex] != ctx.tx.tag)
    {
        JLOG(ctx.j.debug()) << "Supplied tag " << ctx.tx.tag
                            << " does not match signal "
                            << (*signals)[tagIndex];
        return temPAYLOAD_MISMATCH;
    }

    return tesSUCCESS;
}

TER
Transactor::checkProof(PreclaimContext const& ctx)
{
    if (!ctx.verifier.verify(
            ctx.tx.circuit,
            ripple::makeSlice(ctx.tx.proof),
            ripple::makeSlice(ctx.tx.publicSignals)))
    {
        JLOG(ctx.j.warn()) << zkp::to_string(ctx.tx.circuit)
                           << " proof verification failed";
        return tefBAD_PROOF;
    }
    return tesSUCCESS;
}

TER
Transactor::operator()()
{
    try
    {
        return doApply();
    }
    catch (std::exception const& e)
    {
        JLOG(j_.error()) << "Unexpected exception applying "
                         << zkp::to_string(ctx_.tx.circuit) << ": "
                         << e.what();
        return tecINTERNAL;
    }
}

}  // namespace shieldpay
