#include <test/zkp/Groth16Fixture.h>
#include <test/zkp/SignalCircuit.h>

#include <libshieldpay/zkp/WireCodec.h>

#include <libff/common/profiling.hpp>

#include <algorithm>
#include <array>

namespace shieldpay {
namespace test {

namespace {

using pp = zkp::DefaultCurve;

enum class Limbs { bigEndian, littleEndian };

template <mp_size_t n>
std::array<std::uint8_t, 32>
bigintBytes(libff::bigint<n> const& v)
{
    static_assert(static_cast<std::size_t>(n) * sizeof(mp_limb_t) == 32);

    std::array<std::uint8_t, 32> be{};
    for (mp_size_t i = 0; i < n; ++i)
    {
        for (std::size_t j = 0; j < sizeof(mp_limb_t); ++j)
            be[31 - (i * sizeof(mp_limb_t) + j)] =
                static_cast<std::uint8_t>(v.data[i] >> (8 * j));
    }
    return be;
}

void
putFq(Blob& out, libff::alt_bn128_Fq const& x, Limbs order)
{
    auto bytes = bigintBytes(x.as_bigint());
    if (order == Limbs::littleEndian)
        std::reverse(bytes.begin(), bytes.end());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void
putG1(Blob& out, libff::alt_bn128_G1 p, Limbs order)
{
    if (p.is_zero())
    {
        out.insert(out.end(), zkp::g1Bytes, 0);
        return;
    }
    p.to_affine_coordinates();
    putFq(out, p.X, order);
    putFq(out, p.Y, order);
}

// (c0, c1) per coordinate, as the proving toolchain writes it.
void
putG2(Blob& out, libff::alt_bn128_G2 q, Limbs order)
{
    if (q.is_zero())
    {
        out.insert(out.end(), zkp::g2Bytes, 0);
        return;
    }
    q.to_affine_coordinates();
    putFq(out, q.X.c0, order);
    putFq(out, q.X.c1, order);
    putFq(out, q.Y.c0, order);
    putFq(out, q.Y.c1, order);
}

libsnark::r1cs_gg_ppzksnark_keypair<pp>
setup(std::size_t n)
{
    zkp::Groth16Engine::initCurve();
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;

    libsnark::protoboard<FieldT> pb;
    SignalCircuit<FieldT> circuit(pb, n, "fixture");
    circuit.generate_r1cs_constraints();

    return libsnark::r1cs_gg_ppzksnark_generator<pp>(pb.get_constraint_system());
}

Blob
encodeKey(libsnark::r1cs_gg_ppzksnark_keypair<pp> const& kp)
{
    Blob out;
    putG1(out, kp.pk.alpha_g1, Limbs::bigEndian);
    putG2(out, kp.pk.beta_g2, Limbs::bigEndian);
    putG2(out, kp.vk.gamma_g2, Limbs::bigEndian);
    putG2(out, kp.vk.delta_g2, Limbs::bigEndian);
    putG1(out, kp.vk.gamma_ABC_g1.first, Limbs::bigEndian);
    for (auto const& p : kp.vk.gamma_ABC_g1.rest.values)
        putG1(out, p, Limbs::bigEndian);
    return out;
}

}  // namespace

Groth16Fixture::Groth16Fixture(std::size_t publicInputs)
    : n_(publicInputs), keypair_(setup(publicInputs)), vkBlob_(encodeKey(keypair_))
{
}

Blob
Groth16Fixture::prove(std::vector<uint256> const& signals) const
{
    std::vector<FieldT> values;
    values.reserve(signals.size());
    for (auto const& s : signals)
        values.push_back(fromSignal(s));

    libsnark::protoboard<FieldT> pb;
    SignalCircuit<FieldT> circuit(pb, n_, "fixture");
    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(values);

    auto const proof = libsnark::r1cs_gg_ppzksnark_prover<pp>(
        keypair_.pk, pb.primary_input(), pb.auxiliary_input());

    Blob out;
    putG1(out, proof.g_A, Limbs::littleEndian);
    putG2(out, proof.g_B, Limbs::littleEndian);
    putG1(out, proof.g_C, Limbs::littleEndian);
    return out;
}

uint256
toSignal(FieldT const& x)
{
    auto const be = bigintBytes(x.as_bigint());
    uint256 out;
    std::reverse_copy(be.begin(), be.end(), out.begin());
    return out;
}

FieldT
fromSignal(uint256 const& s)
{
    libff::bigint<libff::alt_bn128_r_limbs> v;
    for (mp_size_t i = 0; i < libff::alt_bn128_r_limbs; ++i)
    {
        mp_limb_t limb = 0;
        for (std::size_t j = sizeof(mp_limb_t); j-- > 0;)
            limb = (limb << 8) | s.data()[i * sizeof(mp_limb_t) + j];
        v.data[i] = limb;
    }
    return FieldT(v);
}

uint256
randomSignal()
{
    zkp::Groth16Engine::initCurve();
    return toSignal(FieldT::random_element());
}

}  // namespace test
}  // namespace shieldpay
