#include <libshieldpay/tx/ShieldedWithdraw.h>

#include <libshieldpay/ledger/NullifierRegistry.h>
#include <libshieldpay/ledger/PoolBalance.h>
#include <libshieldpay/ledger/RootHistoryCache.h>

#include <xrpl/basics/Log.h>

namespace shieldpay {

namespace ws = zkp::withdrawSignal;

TER
ShieldedWithdraw::preflight(PreflightContext const& ctx)
{
    if (!ctx.tx.recipient)
    {
        JLOG(ctx.j.debug()) << "Withdraw without recipient";
        return temMALFORMED;
    }

    if (auto const ret = preflight1(ctx, ws::nullifier); !isTesSuccess(ret))
        return ret;

    auto const signals = decodeSignals(ctx.tx, ctx.verifier);

    // The proof names its payee; nobody else can redeem it.
    if ((*signals)[ws::recipient] != zkp::signalFromAccount(*ctx.tx.recipient))
    {
        JLOG(ctx.j.debug()) << "Withdraw recipient "
                            << ripple::toBase58(*ctx.tx.recipient)
                            << " is not the proven recipient";
        return temPAYLOAD_MISMATCH;
    }

    auto const value = signals->asU64(ws::amount);
    if (!value)
    {
        JLOG(ctx.j.debug()) << "Withdraw amount exceeds 64 bits";
        return value.error();
    }

    if (*value == 0)
        return temBAD_AMOUNT;

    return tesSUCCESS;
}

TER
ShieldedWithdraw::preclaim(PreclaimContext const& ctx)
{
    if (auto const ret = checkProof(ctx); !isTesSuccess(ret))
        return ret;

    auto const cache = readRootCache(ctx.view);
    if (!cache)
        return terNO_TREE;

    auto const signals = decodeSignals(ctx.tx, ctx.verifier);
    auto const& root = (*signals)[ws::merkleRoot];
    if (!cache->contains(root))
    {
        JLOG(ctx.j.warn()) << "Withdraw against unknown root " << root;
        return terUNKNOWN_ROOT;
    }

    auto balance = readPoolBalance(ctx.view);
    if (!balance)
        return terNO_TREE;

    if (auto const ret = balance->debit(*signals->asU64(ws::amount));
        !isTesSuccess(ret))
    {
        JLOG(ctx.j.warn()) << "Withdraw exceeds pool balance "
                           << balance->balance() << ": " << transToken(ret);
        return ret;
    }

    return tesSUCCESS;
}

TER
ShieldedWithdraw::doApply()
{
    auto const& s = signals();
    auto const value = *s.asU64(ws::amount);
    auto const& recipient = *ctx_.tx.recipient;

    if (auto const ret =
            NullifierRegistry(view(), j_).consume(s[ws::nullifier]);
        !isTesSuccess(ret))
        return ret;

    auto balance = readPoolBalance(view());
    if (!balance)
        return terNO_TREE;
    if (auto const ret = balance->debit(value); !isTesSuccess(ret))
        return ret;
    writePoolBalance(view(), *balance);

    // Paid last: a refused payment discards the nullifier with the sandbox.
    if (auto const ret = ctx_.mover.move(ctx_.config.vault, recipient, value);
        !isTesSuccess(ret))
    {
        JLOG(j_.warn()) << "Vault payment of " << value << " to "
                        << ripple::toBase58(recipient)
                        << " failed: " << transToken(ret);
        return tecVALUE_MOVE_FAILED;
    }

    receipt_.nullifier = s[ws::nullifier];
    receipt_.merkleRoot = s[ws::merkleRoot];
    receipt_.recipientTag = s[ws::recipient];
    receipt_.tokenId = s[ws::tokenId];
    receipt_.recipient = recipient;
    receipt_.amount = value;

    JLOG(j_.info()) << "Withdraw of " << value << " to "
                    << ripple::toBase58(recipient);
    return tesSUCCESS;
}

}  // namespace shieldpay
