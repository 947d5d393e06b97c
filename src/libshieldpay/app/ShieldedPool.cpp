#include <libshieldpay/app/ShieldedPool.h>

#include <libshieldpay/ledger/DepositMarker.h>
#include <libshieldpay/ledger/NullifierRegistry.h>
#include <libshieldpay/ledger/PoolBalance.h>
#include <libshieldpay/ledger/Sandbox.h>
#include <libshieldpay/tx/ApplySteps.h>
#include <libshieldpay/tx/ShieldedDeposit.h>
#include <libshieldpay/tx/ShieldedTransfer.h>
#include <libshieldpay/tx/ShieldedWithdraw.h>

#include <xrpl/basics/Log.h>

namespace shieldpay {

ShieldedPool::ShieldedPool(
    PoolConfig config,
    zkp::VerifyingKeyRegistry const& keys,
    ApplyView& view,
    ValueMover& mover,
    beast::Journal j)
    : config_(std::move(config)), view_(view), mover_(mover), j_(j)
{
    if (config_.verifier == PoolConfig::Verifier::groth16)
        verifier_ = zkp::ProofVerifier::Strict(keys, config_.codec, j_);
    else
        verifier_ = zkp::ProofVerifier::FormatOnly(keys, j_);
}

TER
ShieldedPool::initialize(uint256 const& genesisRoot)
{
    if (view_.exists(keylet::commitmentTree()))
    {
        JLOG(j_.warn()) << "Shielded pool already initialized";
        return tecDUPLICATE;
    }

    Sandbox sb(view_);
    writeCommitmentTree(sb, CommitmentTree(genesisRoot, config_.treeDepth));
    writeRootCache(sb, RootHistoryCache(config_.rootCacheCapacity));
    writePoolBalance(sb, PoolBalance{});
    sb.apply();

    JLOG(j_.info()) << "Shielded pool initialized: depth "
                    << static_cast<int>(config_.treeDepth) << ", root cache "
                    << config_.rootCacheCapacity << ", genesis root "
                    << genesisRoot;
    return tesSUCCESS;
}

ShieldedTx
ShieldedPool::makeTx(
    zkp::Circuit circuit,
    uint256 const& tag,
    Slice proof,
    Slice publicSignals) const
{
    return ShieldedTx{
        circuit,
        tag,
        Blob(proof.begin(), proof.end()),
        Blob(publicSignals.begin(), publicSignals.end()),
        std::nullopt};
}

ripple::Expected<DepositReceipt, TER>
ShieldedPool::deposit(
    uint256 const& depositHash,
    Slice proof,
    Slice publicSignals,
    BundleInspector const& bundle)
{
    auto const tx =
        makeTx(zkp::Circuit::deposit, depositHash, proof, publicSignals);
    return applyShielded<ShieldedDeposit>(
        view_, tx, *verifier_, config_, &bundle, mover_, j_);
}

ripple::Expected<TransferReceipt, TER>
ShieldedPool::transfer(uint256 const& nullifier, Slice proof, Slice publicSignals)
{
    auto const tx =
        makeTx(zkp::Circuit::transfer, nullifier, proof, publicSignals);
    return applyShielded<ShieldedTransfer>(
        view_, tx, *verifier_, config_, nullptr, mover_, j_);
}

ripple::Expected<WithdrawReceipt, TER>
ShieldedPool::withdraw(
    uint256 const& nullifier,
    Slice proof,
    Slice publicSignals,
    AccountID const& recipient)
{
    auto tx = makeTx(zkp::Circuit::withdraw, nullifier, proof, publicSignals);
    tx.recipient = recipient;
    return applyShielded<ShieldedWithdraw>(
        view_, tx, *verifier_, config_, nullptr, mover_, j_);
}

std::optional<CommitmentTree>
ShieldedPool::treeState() const
{
    return readCommitmentTree(view_);
}

std::optional<RootHistoryCache>
ShieldedPool::rootCache() const
{
    return readRootCache(view_);
}

std::optional<PoolBalance>
ShieldedPool::poolBalance() const
{
    return readPoolBalance(view_);
}

bool
ShieldedPool::nullifierConsumed(uint256 const& tag) const
{
    return isNullifierConsumed(view_, tag);
}

bool
ShieldedPool::depositProcessed(uint256 const& depositHash) const
{
    return isDepositProcessed(view_, depositHash);
}

}  // namespace shieldpay
