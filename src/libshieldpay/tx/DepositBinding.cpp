#include <libshieldpay/tx/DepositBinding.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/strHex.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>

namespace shieldpay {

std::string
depositMemoText(uint256 const& depositHash)
{
    return "deposit:" +
        boost::algorithm::to_lower_copy(
               ripple::strHex(depositHash.begin(), depositHash.end()));
}

TER
assertCompanionTransfer(
    BundleInspector const& bundle,
    AccountID const& vault,
    std::uint64_t amount,
    bool allowWildcard,
    beast::Journal j)
{
    bool const anyAmount = allowWildcard && amount == 0;

    auto const match = bundle.find([&](BundleOperation const& op) {
        if (op.kind != BundleOperation::Kind::transfer &&
            op.kind != BundleOperation::Kind::transferChecked)
            return false;
        if (!op.destination || *op.destination != vault)
            return false;
        return anyAmount || op.amount == amount;
    });

    if (!match)
    {
        JLOG(j.warn()) << "No transfer of " << amount << " to vault "
                       << ripple::toBase58(vault) << " in bundle";
        return tecMISSING_COMPANION_TRANSFER;
    }

    JLOG(j.trace()) << "Companion transfer of " << match->amount
                    << " to vault found";
    return tesSUCCESS;
}

TER
assertCompanionMemo(
    BundleInspector const& bundle,
    uint256 const& depositHash,
    beast::Journal j)
{
    auto const text = depositMemoText(depositHash);

    auto const match = bundle.find([&](BundleOperation const& op) {
        if (op.kind != BundleOperation::Kind::memo)
            return false;

        auto const& p = op.payload;
        if (p.size() == depositHash.size() &&
            std::equal(p.begin(), p.end(), depositHash.begin()))
            return true;

        return p.size() == text.size() &&
            std::equal(p.begin(), p.end(), text.begin());
    });

    if (!match)
    {
        JLOG(j.warn()) << "No memo for deposit " << depositHash << " in bundle";
        return tecMISSING_MEMO;
    }

    return tesSUCCESS;
}

}  // namespace shieldpay
