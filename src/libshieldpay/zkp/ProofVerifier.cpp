#include <libshieldpay/zkp/ProofVerifier.h>

#include <xrpl/basics/Log.h>

#include <algorithm>
#include <iterator>

namespace shieldpay {
namespace zkp {

std::unique_ptr<ProofVerifier>
ProofVerifier::Strict(
    VerifyingKeyRegistry const& keys,
    CodecOptions const& options,
    beast::Journal j)
{
    return std::make_unique<Groth16Verifier>(keys, options, j);
}

std::unique_ptr<ProofVerifier>
ProofVerifier::FormatOnly(VerifyingKeyRegistry const& keys, beast::Journal j)
{
    JLOG(j.warn()) << "Proof verification is disabled; "
                      "only proof and signal sizes are checked";
    return std::make_unique<FormatOnlyVerifier>(keys, j);
}

bool
ProofVerifier::checkShape(Circuit circuit, Slice proof, Slice publicSignals)
    const
{
    if (proof.size() != proofBytes)
    {
        JLOG(j_.debug()) << to_string(circuit)
                         << ": proof length " << proof.size();
        return false;
    }

    auto const expected = publicInputCount(circuit) * fieldBytes;
    if (publicSignals.size() != expected)
    {
        JLOG(j_.debug()) << to_string(circuit) << ": public signals length "
                         << publicSignals.size() << ", expected " << expected;
        return false;
    }

    return true;
}

//------------------------------------------------------------------------------

Groth16Verifier::Groth16Verifier(
    VerifyingKeyRegistry const& keys,
    CodecOptions const& options,
    beast::Journal j)
    : ProofVerifier(keys, j), options_(options)
{
    for (auto const circuit : allCircuits)
    {
        if (auto const vk = keys.find(circuit))
        {
            prepared_[static_cast<std::size_t>(circuit)] =
                Groth16Engine::prepare(*vk);
            JLOG(j_.info()) << "Loaded " << to_string(circuit)
                            << " verifying key with " << vk->publicInputCount()
                            << " public inputs";
        }
    }
}

bool
Groth16Verifier::verify(Circuit circuit, Slice proof, Slice publicSignals) const
{
    auto const& key = prepared_[static_cast<std::size_t>(circuit)];
    if (!key)
    {
        JLOG(j_.debug()) << to_string(circuit) << ": no verifying key loaded";
        return false;
    }

    if (!checkShape(circuit, proof, publicSignals))
        return false;

    auto const wire = decodeProof(proof);
    auto const signals =
        decodePublicSignals(publicSignals, publicInputCount(circuit));
    if (!wire || !signals)
        return false;

    std::vector<uint256> inputs;
    inputs.reserve(signals->size());
    std::transform(
        signals->begin(),
        signals->end(),
        std::back_inserter(inputs),
        [](uint256 const& s) { return toVerifierForm(s); });

    auto const status = Groth16Engine::verify(
        *key, prepareProof(*wire, options_), inputs);

    if (status != Groth16Engine::Status::ok)
    {
        JLOG(j_.debug()) << to_string(circuit)
                         << ": proof rejected: " << to_string(status);
        return false;
    }

    return true;
}

//------------------------------------------------------------------------------

FormatOnlyVerifier::FormatOnlyVerifier(
    VerifyingKeyRegistry const& keys,
    beast::Journal j)
    : ProofVerifier(keys, j)
{
}

bool
FormatOnlyVerifier::verify(Circuit circuit, Slice proof, Slice publicSignals)
    const
{
    return checkShape(circuit, proof, publicSignals);
}

}  // namespace zkp
}  // namespace shieldpay
