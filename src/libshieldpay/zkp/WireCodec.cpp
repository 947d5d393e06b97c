#include <libshieldpay/zkp/WireCodec.h>

#include <algorithm>

namespace shieldpay {
namespace zkp {

// clang-format off
std::array<std::uint8_t, fieldBytes> const bn254FieldModulus = {
    0x30, 0x64, 0x4e, 0x72, 0xe1, 0x31, 0xa0, 0x29,
    0xb8, 0x50, 0x45, 0xb6, 0x81, 0x81, 0x58, 0x5d,
    0x97, 0x81, 0x6a, 0x91, 0x68, 0x71, 0xca, 0x8d,
    0x3c, 0x20, 0x8c, 0x16, 0xd8, 0x7c, 0xfd, 0x47};
// clang-format on

Expected<WireProof, TER>
decodeProof(Slice bytes)
{
    if (bytes.size() != proofBytes)
        return Unexpected(temBAD_PROOF_LENGTH);

    WireProof proof;
    auto const* p = bytes.data();
    std::copy(p, p + g1Bytes, proof.a.begin());
    p += g1Bytes;
    std::copy(p, p + g2Bytes, proof.b.begin());
    p += g2Bytes;
    std::copy(p, p + g1Bytes, proof.c.begin());
    return proof;
}

Expected<std::vector<uint256>, TER>
decodePublicSignals(Slice bytes, std::size_t count)
{
    if (count == 0 || bytes.size() != count * fieldBytes)
        return Unexpected(temBAD_PUBLIC_INPUTS_LENGTH);

    std::vector<uint256> signals;
    signals.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        signals.push_back(uint256::fromVoid(bytes.data() + i * fieldBytes));
    return signals;
}

Blob
encodePublicSignals(std::vector<uint256> const& signals)
{
    Blob out;
    out.reserve(signals.size() * fieldBytes);
    for (auto const& s : signals)
        out.insert(out.end(), s.begin(), s.end());
    return out;
}

uint256
toVerifierForm(uint256 const& in)
{
    uint256 out;
    std::reverse_copy(in.begin(), in.end(), out.begin());
    return out;
}

void
negateG1Y(G1Point& point)
{
    auto const y = point.begin() + fieldBytes;

    if (std::all_of(y, point.end(), [](std::uint8_t b) { return b == 0; }))
        return;

    // Big-endian subtraction, least significant byte last.
    int borrow = 0;
    for (std::size_t i = fieldBytes; i-- > 0;)
    {
        int diff = static_cast<int>(bn254FieldModulus[i]) -
            static_cast<int>(y[i]) - borrow;
        borrow = diff < 0 ? 1 : 0;
        if (borrow)
            diff += 256;
        y[i] = static_cast<std::uint8_t>(diff);
    }
}

void
swapG2InnerLimbs(G2Point& point)
{
    auto const b = point.begin();
    std::swap_ranges(b, b + fieldBytes, b + fieldBytes);
    std::swap_ranges(b + 2 * fieldBytes, b + 3 * fieldBytes, b + 3 * fieldBytes);
}

EngineProof
prepareProof(WireProof const& proof, CodecOptions const& options)
{
    EngineProof out{
        toVerifierForm(proof.a), toVerifierForm(proof.b), toVerifierForm(proof.c)};

    if (options.negateProofA)
        negateG1Y(out.negA);

    if (options.swapProofB)
        swapG2InnerLimbs(out.b);

    return out;
}

}  // namespace zkp
}  // namespace shieldpay
