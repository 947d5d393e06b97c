#include <libshieldpay/tx/ShieldedDeposit.h>

#include <libshieldpay/ledger/CommitmentTree.h>
#include <libshieldpay/ledger/DepositMarker.h>
#include <libshieldpay/ledger/PoolBalance.h>
#include <libshieldpay/ledger/RootHistoryCache.h>
#include <libshieldpay/tx/DepositBinding.h>

#include <xrpl/basics/Log.h>

namespace shieldpay {

namespace ds = zkp::depositSignal;

TER
ShieldedDeposit::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx, ds::depositHash); !isTesSuccess(ret))
        return ret;

    auto const signals = decodeSignals(ctx.tx, ctx.verifier);

    auto const value = signals->asU64(ds::amount);
    if (!value)
    {
        JLOG(ctx.j.debug()) << "Deposit amount exceeds 64 bits";
        return value.error();
    }

    if (*value == 0 && !ctx.config.allowAnyDepositAmount)
    {
        JLOG(ctx.j.debug()) << "Zero deposit amount";
        return temBAD_AMOUNT;
    }

    if (auto const next = signals->asU32(ds::nextLeafIndex); !next)
    {
        JLOG(ctx.j.debug()) << "Deposit leaf index exceeds 32 bits";
        return next.error();
    }

    return tesSUCCESS;
}

TER
ShieldedDeposit::preclaim(PreclaimContext const& ctx)
{
    if (auto const ret = checkProof(ctx); !isTesSuccess(ret))
        return ret;

    auto const signals = decodeSignals(ctx.tx, ctx.verifier);
    auto const& hash = (*signals)[ds::depositHash];

    if (isDepositProcessed(ctx.view, hash))
    {
        // doApply reports the replay without touching state.
        JLOG(ctx.j.info()) << "Deposit " << hash << " already processed";
        return tesSUCCESS;
    }

    if (!ctx.bundle)
    {
        JLOG(ctx.j.warn()) << "Deposit submitted without its bundle";
        return tecMISSING_COMPANION_TRANSFER;
    }

    if (auto const ret = assertCompanionTransfer(
            *ctx.bundle,
            ctx.config.vault,
            *signals->asU64(ds::amount),
            ctx.config.allowAnyDepositAmount,
            ctx.j);
        !isTesSuccess(ret))
        return ret;

    if (auto const ret = assertCompanionMemo(*ctx.bundle, hash, ctx.j);
        !isTesSuccess(ret))
        return ret;

    auto const tree = readCommitmentTree(ctx.view);
    if (!tree)
        return terNO_TREE;

    if (auto const ret = tree->checkAppend(
            (*signals)[ds::oldRoot], *signals->asU32(ds::nextLeafIndex), 1);
        !isTesSuccess(ret))
    {
        JLOG(ctx.j.warn()) << "Deposit out of sync with tree at index "
                           << tree->nextLeafIndex() << ": " << transToken(ret);
        return ret;
    }

    auto balance = readPoolBalance(ctx.view);
    if (!balance)
        return terNO_TREE;

    if (auto const ret = balance->credit(*signals->asU64(ds::amount));
        !isTesSuccess(ret))
    {
        JLOG(ctx.j.warn()) << "Deposit overflows pool balance "
                           << balance->balance();
        return ret;
    }

    return tesSUCCESS;
}

TER
ShieldedDeposit::doApply()
{
    auto const& s = signals();

    receipt_.depositHash = s[ds::depositHash];

    // A replay may carry other signals than the deposit that was credited;
    // only the hash and the tree position are reported for it.
    if (isDepositProcessed(view(), s[ds::depositHash]))
    {
        auto const tree = readCommitmentTree(view());
        if (!tree)
            return terNO_TREE;
        receipt_.newRoot = tree->currentRoot();
        receipt_.nextLeafIndex = tree->nextLeafIndex();
        receipt_.alreadyProcessed = true;
        return tesSUCCESS;
    }

    auto tree = readCommitmentTree(view());
    auto cache = readRootCache(view());
    auto balance = readPoolBalance(view());
    if (!tree || !cache || !balance)
        return terNO_TREE;

    auto const amount = *s.asU64(ds::amount);
    if (auto const ret = balance->credit(amount); !isTesSuccess(ret))
        return ret;

    tree->append(s[ds::newRoot], 1);
    cache->insert(s[ds::newRoot]);

    writeCommitmentTree(view(), *tree);
    writeRootCache(view(), *cache);
    writePoolBalance(view(), *balance);

    if (auto const ret = markDepositProcessed(view(), s[ds::depositHash]);
        !isTesSuccess(ret))
        return ret;

    receipt_.ownerTag = s[ds::owner];
    receipt_.commitment = s[ds::newCommitment];
    receipt_.amount = amount;
    receipt_.newRoot = tree->currentRoot();
    receipt_.nextLeafIndex = tree->nextLeafIndex();

    JLOG(j_.info()) << "Deposit " << s[ds::depositHash] << " of "
                    << receipt_.amount << " appended; next leaf "
                    << receipt_.nextLeafIndex;
    return tesSUCCESS;
}

}  // namespace shieldpay
