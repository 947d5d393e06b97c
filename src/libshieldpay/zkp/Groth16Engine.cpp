#include <libshieldpay/zkp/Groth16Engine.h>

#include <xrpl/basics/contract.h>

#include <gmp.h>

#include <algorithm>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace shieldpay {
namespace zkp {

namespace {

using Fq = libff::alt_bn128_Fq;
using Fq2 = libff::alt_bn128_Fq2;
using Fr = libff::alt_bn128_Fr;
using G1 = libff::alt_bn128_G1;
using G2 = libff::alt_bn128_G2;

bool
allZero(std::uint8_t const* p, std::size_t n)
{
    return std::all_of(p, p + n, [](std::uint8_t b) { return b == 0; });
}

// Read a 32-byte big-endian integer into `out`; false unless out < modulus.
template <mp_size_t n>
bool
readCanonical(
    std::uint8_t const* be,
    libff::bigint<n> const& modulus,
    libff::bigint<n>& out)
{
    static_assert(
        static_cast<std::size_t>(n) * sizeof(mp_limb_t) == fieldBytes,
        "field elements must be four 64-bit limbs");

    for (mp_size_t i = 0; i < n; ++i)
    {
        auto const* p = be + fieldBytes - (i + 1) * sizeof(mp_limb_t);
        mp_limb_t limb = 0;
        for (std::size_t j = 0; j < sizeof(mp_limb_t); ++j)
            limb = (limb << 8) | p[j];
        out.data[i] = limb;
    }
    return mpn_cmp(out.data, modulus.data, n) < 0;
}

std::optional<Fq>
readFq(std::uint8_t const* be)
{
    libff::bigint<libff::alt_bn128_q_limbs> v;
    if (!readCanonical(be, libff::alt_bn128_modulus_q, v))
        return std::nullopt;
    return Fq(v);
}

std::optional<G1>
readG1(G1Point const& bytes)
{
    if (allZero(bytes.data(), bytes.size()))
        return G1::zero();

    auto const x = readFq(bytes.data());
    auto const y = readFq(bytes.data() + fieldBytes);
    if (!x || !y)
        return std::nullopt;

    G1 point(*x, *y, Fq::one());
    if (!point.is_well_formed())
        return std::nullopt;
    return point;
}

std::optional<G2>
readG2(G2Point const& bytes)
{
    if (allZero(bytes.data(), bytes.size()))
        return G2::zero();

    auto const* p = bytes.data();
    auto const xc1 = readFq(p);
    auto const xc0 = readFq(p + fieldBytes);
    auto const yc1 = readFq(p + 2 * fieldBytes);
    auto const yc0 = readFq(p + 3 * fieldBytes);
    if (!xc0 || !xc1 || !yc0 || !yc1)
        return std::nullopt;

    G2 point(Fq2(*xc0, *xc1), Fq2(*yc0, *yc1), Fq2::one());
    if (!point.is_well_formed())
        return std::nullopt;

    // The twist has a large cofactor; reject points outside the r-torsion.
    if (!(Fr::field_char() * point).is_zero())
        return std::nullopt;
    return point;
}

std::optional<Fr>
readFr(uint256 const& be)
{
    libff::bigint<libff::alt_bn128_r_limbs> v;
    if (!readCanonical(be.data(), libff::alt_bn128_modulus_r, v))
        return std::nullopt;
    return Fr(v);
}

G1
requireG1(G1Point const& bytes, char const* what)
{
    auto point = readG1(bytes);
    if (!point)
        ripple::Throw<std::invalid_argument>(
            std::string("verifying key: invalid G1 point ") + what);
    return *point;
}

G2
requireG2(G2Point const& bytes, char const* what)
{
    auto point = readG2(bytes);
    if (!point)
        ripple::Throw<std::invalid_argument>(
            std::string("verifying key: invalid G2 point ") + what);
    return *point;
}

}  // namespace

void
Groth16Engine::initCurve()
{
    static std::once_flag once;
    std::call_once(once, [] { DefaultCurve::init_public_params(); });
}

Groth16Engine::PreparedKey
Groth16Engine::prepare(VerifyingKey const& vk)
{
    initCurve();

    if (vk.ic.empty())
        ripple::Throw<std::invalid_argument>("verifying key: no IC points");

    PreparedKey key;
    key.alpha = requireG1(vk.alpha, "alpha");
    key.beta = requireG2(vk.beta, "beta");
    key.gamma = requireG2(vk.gamma, "gamma");
    key.delta = requireG2(vk.delta, "delta");

    key.ic.reserve(vk.ic.size());
    for (auto const& point : vk.ic)
        key.ic.push_back(requireG1(point, "IC"));

    return key;
}

Groth16Engine::Status
Groth16Engine::verify(
    PreparedKey const& key,
    EngineProof const& proof,
    std::vector<uint256> const& publicInputs)
{
    initCurve();

    if (publicInputs.size() + 1 != key.ic.size())
        return Status::inputCountMismatch;

    auto const negA = readG1(proof.negA);
    auto const b = readG2(proof.b);
    auto const c = readG1(proof.c);
    if (!negA || !b || !c)
        return Status::badProofPoint;

    G1 vkX = key.ic[0];
    for (std::size_t i = 0; i < publicInputs.size(); ++i)
    {
        auto const x = readFr(publicInputs[i]);
        if (!x)
            return Status::badPublicInput;
        vkX = vkX + (*x) * key.ic[i + 1];
    }

    auto ml = libff::alt_bn128_Fq12::one();
    auto const accumulate = [&ml](G1 const& p, G2 const& q) {
        // e(O, Q) == e(P, O) == 1
        if (p.is_zero() || q.is_zero())
            return;
        ml = ml *
            DefaultCurve::miller_loop(
                 DefaultCurve::precompute_G1(p), DefaultCurve::precompute_G2(q));
    };

    accumulate(*negA, *b);
    accumulate(key.alpha, key.beta);
    accumulate(vkX, key.gamma);
    accumulate(*c, key.delta);

    if (DefaultCurve::final_exponentiation(ml) != libff::alt_bn128_GT::one())
        return Status::pairingMismatch;

    return Status::ok;
}

char const*
to_string(Groth16Engine::Status status)
{
    switch (status)
    {
        case Groth16Engine::Status::ok:
            return "ok";
        case Groth16Engine::Status::badProofPoint:
            return "proof point is not a valid curve point";
        case Groth16Engine::Status::badPublicInput:
            return "public input is not below the scalar field modulus";
        case Groth16Engine::Status::inputCountMismatch:
            return "public input count does not match the key";
        case Groth16Engine::Status::pairingMismatch:
            return "pairing product is not one";
    }
    return "unknown";
}

}  // namespace zkp
}  // namespace shieldpay
