#include <libshieldpay/zkp/VerifyingKey.h>

#include <algorithm>

namespace shieldpay {
namespace zkp {

namespace {

template <std::size_t N>
std::uint8_t const*
take(std::uint8_t const* p, std::array<std::uint8_t, N>& out)
{
    std::copy(p, p + N, out.begin());
    return p + N;
}

template <std::size_t N>
void
put(Blob& out, std::array<std::uint8_t, N> const& in)
{
    out.insert(out.end(), in.begin(), in.end());
}

}  // namespace

Expected<VerifyingKey, TER>
parseVerifyingKey(Slice blob)
{
    if (blob.size() < minVerifyingKeyBytes)
        return Unexpected(temBAD_VERIFYING_KEY);

    auto const icBytes = blob.size() - (g1Bytes + 3 * g2Bytes);
    if (icBytes % g1Bytes != 0)
        return Unexpected(temBAD_VERIFYING_KEY);

    auto const icCount = icBytes / g1Bytes;
    if (icCount > maxIcPoints)
        return Unexpected(temBAD_VERIFYING_KEY);

    VerifyingKey vk;
    auto const* p = blob.data();
    p = take(p, vk.alpha);
    p = take(p, vk.beta);
    p = take(p, vk.gamma);
    p = take(p, vk.delta);

    vk.ic.resize(icCount);
    for (auto& point : vk.ic)
        p = take(p, point);

    return vk;
}

Blob
serializeVerifyingKey(VerifyingKey const& vk)
{
    Blob out;
    out.reserve(g1Bytes + 3 * g2Bytes + vk.ic.size() * g1Bytes);
    put(out, vk.alpha);
    put(out, vk.beta);
    put(out, vk.gamma);
    put(out, vk.delta);
    for (auto const& point : vk.ic)
        put(out, point);
    return out;
}

void
applyG2Order(VerifyingKey& vk, CodecOptions const& options)
{
    if (!options.swapVkG2)
        return;

    swapG2InnerLimbs(vk.beta);
    swapG2InnerLimbs(vk.gamma);
    swapG2InnerLimbs(vk.delta);
}

}  // namespace zkp
}  // namespace shieldpay
