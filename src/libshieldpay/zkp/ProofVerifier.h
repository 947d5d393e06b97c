#pragma once

#include <libshieldpay/zkp/Circuit.h>
#include <libshieldpay/zkp/Groth16Engine.h>
#include <libshieldpay/zkp/VerifyingKeyRegistry.h>
#include <libshieldpay/zkp/WireCodec.h>

#include <xrpl/beast/utility/Journal.h>

#include <array>
#include <memory>
#include <optional>

namespace shieldpay {
namespace zkp {

/** Checks proofs for the pool's circuits.

    Which implementation is used is decided once, when the pool is set up,
    never by looking at the data being verified. Every failure collapses to
    `false`; the reason only reaches the journal.
*/
class ProofVerifier
{
public:
    virtual ~ProofVerifier() = default;

    ProofVerifier(ProofVerifier const&) = delete;
    ProofVerifier&
    operator=(ProofVerifier const&) = delete;

    /** Verify `proof` for `circuit` against its wire-form public signals. */
    virtual bool
    verify(Circuit circuit, Slice proof, Slice publicSignals) const = 0;

    /** Number of public signals a proof for `circuit` carries. */
    std::size_t
    publicInputCount(Circuit circuit) const
    {
        return keys_.publicInputCount(circuit);
    }

    /** Full pairing-based verification of every proof. */
    static std::unique_ptr<ProofVerifier>
    Strict(
        VerifyingKeyRegistry const& keys,
        CodecOptions const& options,
        beast::Journal j);

    /** Accepts any proof of the right shape; for tests and tooling only. */
    static std::unique_ptr<ProofVerifier>
    FormatOnly(VerifyingKeyRegistry const& keys, beast::Journal j);

protected:
    ProofVerifier(VerifyingKeyRegistry const& keys, beast::Journal j)
        : keys_(keys), j_(j)
    {
    }

    /** Shared shape checks: proof size and signal count. */
    bool
    checkShape(Circuit circuit, Slice proof, Slice publicSignals) const;

    // A copy, so the verifier outlives the registry it was built from.
    VerifyingKeyRegistry const keys_;
    beast::Journal const j_;
};

/** Verifier backed by the BN254 pairing engine. */
class Groth16Verifier : public ProofVerifier
{
public:
    /** Prepares every configured key.

        @throws std::invalid_argument if a key holds an invalid point.
    */
    Groth16Verifier(
        VerifyingKeyRegistry const& keys,
        CodecOptions const& options,
        beast::Journal j);

    bool
    verify(Circuit circuit, Slice proof, Slice publicSignals) const override;

private:
    CodecOptions const options_;
    std::array<std::optional<Groth16Engine::PreparedKey>, allCircuits.size()>
        prepared_;
};

/** Verifier that only checks sizes. */
class FormatOnlyVerifier : public ProofVerifier
{
public:
    FormatOnlyVerifier(VerifyingKeyRegistry const& keys, beast::Journal j);

    bool
    verify(Circuit circuit, Slice proof, Slice publicSignals) const override;
};

}  // namespace zkp
}  // namespace shieldpay
