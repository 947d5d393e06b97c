#include <libshieldpay/ledger/NullifierRegistry.h>

#include <xrpl/basics/Log.h>
#include <xrpl/protocol/Serializer.h>

namespace shieldpay {

namespace {

bool
consumedFlag(StateEntry const& sle)
{
    ripple::SerialIter sit(sle.slice());
    return sit.get8() != 0;
}

}  // namespace

TER
NullifierRegistry::consume(uint256 const& tag)
{
    auto const k = keylet::nullifier(tag);

    if (auto const sle = view_.read(k); sle && consumedFlag(*sle))
    {
        JLOG(j_.warn()) << "Nullifier already consumed: " << tag;
        return tecNULLIFIER_USED;
    }

    ripple::Serializer s;
    s.add8(1);

    if (auto sle = view_.peek(k))
    {
        sle->setData(s.peekData());
        view_.update(sle);
    }
    else
    {
        view_.insert(std::make_shared<StateEntry>(k, s.peekData()));
    }

    JLOG(j_.trace()) << "Nullifier consumed: " << tag;
    return tesSUCCESS;
}

bool
isNullifierConsumed(ReadView const& view, uint256 const& tag)
{
    auto const sle = view.read(keylet::nullifier(tag));
    return sle && consumedFlag(*sle);
}

}  // namespace shieldpay
