#ifndef SHIELDPAY_CORE_POOLCONFIG_H_INCLUDED
#define SHIELDPAY_CORE_POOLCONFIG_H_INCLUDED

#include <libshieldpay/ledger/RootHistoryCache.h>
#include <libshieldpay/zkp/Circuit.h>
#include <libshieldpay/zkp/WireCodec.h>

#include <xrpl/basics/BasicConfig.h>
#include <xrpl/protocol/AccountID.h>

#include <map>
#include <string>

namespace shieldpay {

/** Build-time codec defaults, overridable from the configuration file. */
#ifndef SHIELDPAY_NEGATE_PROOF_A
#define SHIELDPAY_NEGATE_PROOF_A 1
#endif
#ifndef SHIELDPAY_SWAP_PROOF_B
#define SHIELDPAY_SWAP_PROOF_B 1
#endif
#ifndef SHIELDPAY_SWAP_VK_G2
#define SHIELDPAY_SWAP_VK_G2 1
#endif

constexpr char const* const SECTION_SHIELDED_POOL = "shielded_pool";

/** Settings of one shielded pool. */
struct PoolConfig
{
    enum class Verifier { groth16, formatOnly };

    Verifier verifier = Verifier::groth16;
    zkp::CodecOptions codec{
        SHIELDPAY_NEGATE_PROOF_A != 0,
        SHIELDPAY_SWAP_PROOF_B != 0,
        SHIELDPAY_SWAP_VK_G2 != 0};

    std::uint32_t rootCacheCapacity = defaultRootCacheCapacity;
    std::uint8_t treeDepth = 20;

    /** Account holding deposited value; withdrawals are paid from it. */
    ripple::AccountID vault;

    /** Accept a zero deposit amount as "any amount". Never in production. */
    bool allowAnyDepositAmount = false;

    /** Verifying key file per circuit. */
    std::map<zkp::Circuit, std::string> keyFiles;
};

/** Read the [shielded_pool] section.

    Example:

        [shielded_pool]
        verifier=groth16
        vault=rHb9CJAWyB4rj91VRWn96DkukG4bwdtyTh
        tree_depth=20
        root_cache_capacity=1024
        deposit_vk=/etc/shieldpay/deposit.vk
        transfer_vk=/etc/shieldpay/transfer.vk
        withdraw_vk=/etc/shieldpay/withdraw.vk

    @throws std::runtime_error on a missing or invalid value.
*/
PoolConfig
setupPoolConfig(ripple::Section const& section);

}  // namespace shieldpay

#endif
