#ifndef SHIELDPAY_APP_SHIELDEDPOOL_H_INCLUDED
#define SHIELDPAY_APP_SHIELDEDPOOL_H_INCLUDED

#include <libshieldpay/core/PoolConfig.h>
#include <libshieldpay/ledger/CommitmentTree.h>
#include <libshieldpay/ledger/PoolBalance.h>
#include <libshieldpay/ledger/ReadView.h>
#include <libshieldpay/ledger/RootHistoryCache.h>
#include <libshieldpay/tx/Bundle.h>
#include <libshieldpay/tx/Receipts.h>
#include <libshieldpay/tx/ValueMover.h>
#include <libshieldpay/zkp/ProofVerifier.h>
#include <libshieldpay/zkp/VerifyingKeyRegistry.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>

#include <memory>
#include <optional>

namespace shieldpay {

/** Entry point for the host: a shielded pool over one state store.

    Calls are synchronous and must not overlap; the host serializes the
    atomic units that touch the pool. Each call either commits all of its
    state changes or none of them.
*/
class ShieldedPool
{
public:
    /** Set up the pool and its proof verifier.

        The verifier keeps its own copy of `keys`.

        @throws std::invalid_argument if a verifying key holds an invalid
                point (groth16 verifier only).
    */
    ShieldedPool(
        PoolConfig config,
        zkp::VerifyingKeyRegistry const& keys,
        ApplyView& view,
        ValueMover& mover,
        beast::Journal j);

    ShieldedPool(ShieldedPool const&) = delete;
    ShieldedPool&
    operator=(ShieldedPool const&) = delete;

    /** Create the commitment tree, an empty root history and a zero
        pool balance.

        @return tecDUPLICATE if the pool was already initialized.
    */
    TER
    initialize(uint256 const& genesisRoot);

    ripple::Expected<DepositReceipt, TER>
    deposit(
        uint256 const& depositHash,
        Slice proof,
        Slice publicSignals,
        BundleInspector const& bundle);

    ripple::Expected<TransferReceipt, TER>
    transfer(uint256 const& nullifier, Slice proof, Slice publicSignals);

    ripple::Expected<WithdrawReceipt, TER>
    withdraw(
        uint256 const& nullifier,
        Slice proof,
        Slice publicSignals,
        AccountID const& recipient);

    std::optional<CommitmentTree>
    treeState() const;

    std::optional<RootHistoryCache>
    rootCache() const;

    std::optional<PoolBalance>
    poolBalance() const;

    bool
    nullifierConsumed(uint256 const& tag) const;

    bool
    depositProcessed(uint256 const& depositHash) const;

    zkp::ProofVerifier const&
    verifier() const
    {
        return *verifier_;
    }

    PoolConfig const&
    config() const
    {
        return config_;
    }

private:
    ShieldedTx
    makeTx(
        zkp::Circuit circuit,
        uint256 const& tag,
        Slice proof,
        Slice publicSignals) const;

    PoolConfig const config_;
    ApplyView& view_;
    ValueMover& mover_;
    beast::Journal const j_;
    std::unique_ptr<zkp::ProofVerifier> verifier_;
};

}  // namespace shieldpay

#endif
