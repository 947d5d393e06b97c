#include <libshieldpay/tx/ShieldedTransfer.h>

#include <libshieldpay/ledger/CommitmentTree.h>
#include <libshieldpay/ledger/NullifierRegistry.h>
#include <libshieldpay/ledger/RootHistoryCache.h>

#include <xrpl/basics/Log.h>

namespace shieldpay {

namespace ts = zkp::transferSignal;

TER
ShieldedTransfer::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx, ts::nullifier); !isTesSuccess(ret))
        return ret;

    auto const signals = decodeSignals(ctx.tx, ctx.verifier);
    if (auto const next = signals->asU32(ts::nextLeafIndex); !next)
    {
        JLOG(ctx.j.debug()) << "Transfer leaf index exceeds 32 bits";
        return next.error();
    }

    return tesSUCCESS;
}

TER
ShieldedTransfer::preclaim(PreclaimContext const& ctx)
{
    if (auto const ret = checkProof(ctx); !isTesSuccess(ret))
        return ret;

    auto const tree = readCommitmentTree(ctx.view);
    if (!tree)
        return terNO_TREE;

    auto const signals = decodeSignals(ctx.tx, ctx.verifier);
    auto const ret = tree->checkAppend(
        (*signals)[ts::spentRoot], *signals->asU32(ts::nextLeafIndex), 2);
    if (!isTesSuccess(ret))
    {
        JLOG(ctx.j.warn()) << "Transfer out of sync with tree at index "
                           << tree->nextLeafIndex() << ": " << transToken(ret);
    }
    return ret;
}

TER
ShieldedTransfer::doApply()
{
    auto const& s = signals();

    auto tree = readCommitmentTree(view());
    auto cache = readRootCache(view());
    if (!tree || !cache)
        return terNO_TREE;

    if (auto const ret =
            NullifierRegistry(view(), j_).consume(s[ts::nullifier]);
        !isTesSuccess(ret))
        return ret;

    tree->append(s[ts::newRoot2], 2);
    cache->insert(s[ts::newRoot1]);
    cache->insert(s[ts::newRoot2]);

    writeCommitmentTree(view(), *tree);
    writeRootCache(view(), *cache);

    receipt_.nullifier = s[ts::nullifier];
    receipt_.outCommitment1 = s[ts::outCommitment1];
    receipt_.outCommitment2 = s[ts::outCommitment2];
    receipt_.encryptedNote1 = s[ts::encryptedNote1];
    receipt_.encryptedNote2 = s[ts::encryptedNote2];
    receipt_.newRoot1 = s[ts::newRoot1];
    receipt_.newRoot2 = s[ts::newRoot2];
    receipt_.nextLeafIndex = tree->nextLeafIndex();

    JLOG(j_.info()) << "Transfer spent " << s[ts::nullifier]
                    << "; next leaf " << receipt_.nextLeafIndex;
    return tesSUCCESS;
}

}  // namespace shieldpay
