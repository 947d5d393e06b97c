#pragma once

#include <libshieldpay/zkp/WireCodec.h>

#include <vector>

namespace shieldpay {
namespace zkp {

/** Upper bound on IC points; allows circuits with up to 63 public inputs. */
constexpr std::size_t maxIcPoints = 64;

/** Smallest well-formed verifying key blob: alpha, beta, gamma, delta, IC[0]. */
constexpr std::size_t minVerifyingKeyBytes = g1Bytes + 3 * g2Bytes + g1Bytes;

/** A Groth16 verifying key, every limb big-endian.

    Layout of the serialized blob:

        alpha (G1) || beta (G2) || gamma (G2) || delta (G2) || IC[0..N] (G1)

    where N is the number of public inputs of the circuit.
*/
struct VerifyingKey
{
    G1Point alpha;
    G2Point beta;
    G2Point gamma;
    G2Point delta;
    std::vector<G1Point> ic;

    std::size_t
    publicInputCount() const
    {
        return ic.empty() ? 0 : ic.size() - 1;
    }
};

/** Parse a verifying key blob. Fails with temBAD_VERIFYING_KEY. */
Expected<VerifyingKey, TER>
parseVerifyingKey(Slice blob);

/** Serialize a key into the blob layout parseVerifyingKey accepts. */
Blob
serializeVerifyingKey(VerifyingKey const& vk);

/** Bring the key's G2 points into the engine's (c1, c0) limb order. */
void
applyG2Order(VerifyingKey& vk, CodecOptions const& options);

}  // namespace zkp
}  // namespace shieldpay
