#include <libshieldpay/ledger/DepositMarker.h>

#include <xrpl/protocol/Serializer.h>

namespace shieldpay {

bool
isDepositProcessed(ReadView const& view, uint256 const& depositHash)
{
    auto const sle = view.read(keylet::depositMarker(depositHash));
    if (!sle)
        return false;

    ripple::SerialIter sit(sle->slice());
    return sit.get8() != 0;
}

TER
markDepositProcessed(ApplyView& view, uint256 const& depositHash)
{
    auto const k = keylet::depositMarker(depositHash);
    if (view.exists(k))
        return tecDUPLICATE;

    ripple::Serializer s;
    s.add8(1);
    view.insert(std::make_shared<StateEntry>(k, s.peekData()));
    return tesSUCCESS;
}

}  // namespace shieldpay
