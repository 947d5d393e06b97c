#include <libshieldpay/core/PoolConfig.h>

#include <xrpl/beast/unit_test.h>
#include <xrpl/protocol/AccountID.h>

#include <stdexcept>

namespace shieldpay {

class PoolConfig_test : public beast::unit_test::suite
{
    std::string const vault_ = ripple::toBase58(ripple::AccountID{0x5a});

    ripple::Section
    minimal() const
    {
        ripple::Section s(SECTION_SHIELDED_POOL);
        s.set("verifier", "format_only");
        s.set("vault", vault_);
        return s;
    }

    template <class F>
    void
    expectThrow(F&& f, char const* what)
    {
        try
        {
            f();
            fail(what);
        }
        catch (std::runtime_error const& e)
        {
            pass();
            log << e.what() << std::endl;
        }
    }

    void
    testDefaults()
    {
        testcase("defaults");

        auto const config = setupPoolConfig(minimal());
        BEAST_EXPECT(config.verifier == PoolConfig::Verifier::formatOnly);
        BEAST_EXPECT(config.vault == ripple::AccountID{0x5a});
        BEAST_EXPECT(config.rootCacheCapacity == defaultRootCacheCapacity);
        BEAST_EXPECT(config.treeDepth == 20);
        BEAST_EXPECT(!config.allowAnyDepositAmount);
        BEAST_EXPECT(config.keyFiles.empty());
        BEAST_EXPECT(config.codec.negateProofA == (SHIELDPAY_NEGATE_PROOF_A != 0));
        BEAST_EXPECT(config.codec.swapProofB == (SHIELDPAY_SWAP_PROOF_B != 0));
        BEAST_EXPECT(config.codec.swapVkG2 == (SHIELDPAY_SWAP_VK_G2 != 0));
    }

    void
    testOverrides()
    {
        testcase("overrides");

        auto s = minimal();
        s.set("verifier", "groth16");
        s.set("tree_depth", "32");
        s.set("root_cache_capacity", "4096");
        s.set("negate_proof_a", "0");
        s.set("swap_proof_b", "0");
        s.set("swap_vk_g2", "1");
        s.set("allow_any_deposit_amount", "1");
        s.set("deposit_vk", "/keys/deposit.vk");
        s.set("transfer_vk", "/keys/transfer.vk");
        s.set("withdraw_vk", "/keys/withdraw.vk");

        auto const config = setupPoolConfig(s);
        BEAST_EXPECT(config.verifier == PoolConfig::Verifier::groth16);
        BEAST_EXPECT(config.treeDepth == 32);
        BEAST_EXPECT(config.rootCacheCapacity == 4096);
        BEAST_EXPECT(!config.codec.negateProofA);
        BEAST_EXPECT(!config.codec.swapProofB);
        BEAST_EXPECT(config.codec.swapVkG2);
        BEAST_EXPECT(config.allowAnyDepositAmount);
        BEAST_EXPECT(config.keyFiles.size() == 3);
        BEAST_EXPECT(
            config.keyFiles.at(zkp::Circuit::transfer) == "/keys/transfer.vk");
    }

    void
    testInvalid()
    {
        testcase("invalid values");

        auto const with = [this](char const* key, char const* value) {
            auto s = minimal();
            s.set(key, value);
            return s;
        };

        expectThrow(
            [&] { setupPoolConfig(with("verifier", "plonk")); },
            "unknown verifier accepted");
        expectThrow(
            [&] { setupPoolConfig(with("tree_depth", "0")); },
            "zero depth accepted");
        expectThrow(
            [&] { setupPoolConfig(with("tree_depth", "33")); },
            "depth 33 accepted");
        expectThrow(
            [&] { setupPoolConfig(with("tree_depth", "deep")); },
            "non-numeric depth accepted");
        expectThrow(
            [&] { setupPoolConfig(with("root_cache_capacity", "0")); },
            "empty cache accepted");
        expectThrow(
            [&] { setupPoolConfig(with("root_cache_capacity", "4097")); },
            "oversized cache accepted");
        expectThrow(
            [&] { setupPoolConfig(with("negate_proof_a", "2")); },
            "flag value 2 accepted");
        expectThrow(
            [&] { setupPoolConfig(with("vault", "not-an-account")); },
            "bad vault accepted");

        expectThrow(
            [&] {
                ripple::Section s(SECTION_SHIELDED_POOL);
                s.set("verifier", "format_only");
                setupPoolConfig(s);
            },
            "missing vault accepted");

        expectThrow(
            [&] {
                auto s = with("verifier", "groth16");
                s.set("deposit_vk", "/keys/deposit.vk");
                s.set("withdraw_vk", "/keys/withdraw.vk");
                setupPoolConfig(s);
            },
            "groth16 without a transfer key accepted");
    }

public:
    void
    run() override
    {
        testDefaults();
        testOverrides();
        testInvalid();
    }
};

BEAST_DEFINE_TESTSUITE(PoolConfig, core, shieldpay);

}  // namespace shieldpay
