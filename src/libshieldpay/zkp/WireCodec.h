#pragma once

#include <libshieldpay/protocol/TER.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Expected.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace shieldpay {
namespace zkp {

using ripple::Blob;
using ripple::Expected;
using ripple::Slice;
using ripple::uint256;
using ripple::Unexpected;

constexpr std::size_t fieldBytes = 32;
constexpr std::size_t g1Bytes = 2 * fieldBytes;
constexpr std::size_t g2Bytes = 4 * fieldBytes;
constexpr std::size_t proofBytes = g1Bytes + g2Bytes + g1Bytes;

/** Uncompressed G1 point: x || y, one 32-byte limb per coordinate. */
using G1Point = std::array<std::uint8_t, g1Bytes>;

/** Uncompressed G2 point: four 32-byte limbs, two per Fq2 coordinate. */
using G2Point = std::array<std::uint8_t, g2Bytes>;

/** BN254 base field modulus p, big-endian. */
extern std::array<std::uint8_t, fieldBytes> const bn254FieldModulus;

/** Build-time switches describing how the proving toolchain lays out points.

    Defaults match snarkjs-style toolchains: the proof's A must be negated
    for the product-of-pairings check, and G2 points arrive as (c0, c1)
    while the pairing engine expects (c1, c0).
*/
struct CodecOptions
{
    bool negateProofA = true;
    bool swapProofB = true;
    bool swapVkG2 = true;
};

/** A proof exactly as it arrives: every limb little-endian. */
struct WireProof
{
    G1Point a;
    G2Point b;
    G1Point c;
};

/** A proof converted to the engine's big-endian layout, ready to verify. */
struct EngineProof
{
    G1Point negA;
    G2Point b;
    G1Point c;
};

/** Split a 256-byte proof into A (0..64), B (64..192) and C (192..256).

    No point validation happens here.
*/
Expected<WireProof, TER>
decodeProof(Slice bytes);

/** Split a public signal buffer into `count` 32-byte little-endian values. */
Expected<std::vector<uint256>, TER>
decodePublicSignals(Slice bytes, std::size_t count);

/** Concatenate public signals back into wire form. */
Blob
encodePublicSignals(std::vector<uint256> const& signals);

/** Reverse the byte order of every 32-byte limb independently.

    The same transform converts in both directions.
*/
template <std::size_t N>
std::array<std::uint8_t, N>
toVerifierForm(std::array<std::uint8_t, N> const& in)
{
    static_assert(N % fieldBytes == 0, "point size must be whole limbs");

    std::array<std::uint8_t, N> out;
    for (std::size_t limb = 0; limb < N; limb += fieldBytes)
    {
        for (std::size_t i = 0; i < fieldBytes; ++i)
            out[limb + i] = in[limb + fieldBytes - 1 - i];
    }
    return out;
}

/** Reverse the bytes of one field element. */
uint256
toVerifierForm(uint256 const& in);

/** Replace y by p - y on a big-endian G1 point. y == 0 is left as is. */
void
negateG1Y(G1Point& point);

/** Exchange the two limbs of each Fq2 coordinate of a G2 point. */
void
swapG2InnerLimbs(G2Point& point);

/** Apply the per-limb flip, A negation and B reorder a proof needs. */
EngineProof
prepareProof(WireProof const& proof, CodecOptions const& options);

}  // namespace zkp
}  // namespace shieldpay
