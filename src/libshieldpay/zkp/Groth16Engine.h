#pragma once

#include <libshieldpay/zkp/VerifyingKey.h>
#include <libshieldpay/zkp/WireCodec.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include <vector>

namespace shieldpay {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;

/** Groth16 verification over BN254 on top of libff's alt_bn128 pairing.

    Inputs are in the engine byte layout: big-endian limbs, G2 coordinates
    ordered (c1, c0), and the proof's A already negated. The check is

        e(-A, B) * e(alpha, beta) * e(vk_x, gamma) * e(C, delta) == 1

    with vk_x = IC[0] + sum(x_i * IC[i + 1]), computed as one product of
    Miller loops followed by a single final exponentiation.
*/
class Groth16Engine
{
public:
    enum class Status {
        ok,
        badProofPoint,
        badPublicInput,
        inputCountMismatch,
        pairingMismatch,
    };

    /** A verifying key decoded into curve points. */
    struct PreparedKey
    {
        libff::alt_bn128_G1 alpha;
        libff::alt_bn128_G2 beta;
        libff::alt_bn128_G2 gamma;
        libff::alt_bn128_G2 delta;
        std::vector<libff::alt_bn128_G1> ic;
    };

    /** Initialize libff's curve parameters. Safe to call repeatedly. */
    static void
    initCurve();

    /** Decode and validate every point of a key in engine layout.

        @throws std::invalid_argument if a point is off the curve, outside
                the prime-order subgroup or not canonically encoded.
    */
    static PreparedKey
    prepare(VerifyingKey const& vk);

    /** Run the pairing check.

        @param publicInputs big-endian field elements, one per IC point
                            after the first.
    */
    static Status
    verify(
        PreparedKey const& key,
        EngineProof const& proof,
        std::vector<uint256> const& publicInputs);
};

char const*
to_string(Groth16Engine::Status status);

}  // namespace zkp
}  // namespace shieldpay
