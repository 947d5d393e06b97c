#include <libshieldpay/ledger/PoolBalance.h>

#include <xrpl/basics/contract.h>

#include <limits>
#include <stdexcept>

namespace shieldpay {

namespace {

bool
addOverflows(std::uint64_t a, std::uint64_t b)
{
    return b > std::numeric_limits<std::uint64_t>::max() - a;
}

}  // namespace

TER
PoolBalance::credit(std::uint64_t amount)
{
    if (addOverflows(deposited_, amount) || addOverflows(balance_, amount))
        return tecARITHMETIC;

    deposited_ += amount;
    balance_ += amount;
    return tesSUCCESS;
}

TER
PoolBalance::debit(std::uint64_t amount)
{
    if (amount > balance_)
        return tecINSUFFICIENT_FUNDS;
    if (addOverflows(withdrawn_, amount))
        return tecARITHMETIC;

    withdrawn_ += amount;
    balance_ -= amount;
    return tesSUCCESS;
}

void
PoolBalance::serialize(ripple::Serializer& s) const
{
    s.add64(deposited_);
    s.add64(withdrawn_);
    s.add64(balance_);
}

PoolBalance
PoolBalance::deserialize(ripple::SerialIter& sit)
{
    auto const deposited = sit.get64();
    auto const withdrawn = sit.get64();
    auto const balance = sit.get64();

    if (withdrawn > deposited || balance != deposited - withdrawn)
        ripple::Throw<std::runtime_error>("PoolBalance: inconsistent totals");

    return PoolBalance(deposited, withdrawn, balance);
}

std::optional<PoolBalance>
readPoolBalance(ReadView const& view)
{
    auto const sle = view.read(keylet::poolBalance());
    if (!sle)
        return std::nullopt;

    ripple::SerialIter sit(sle->slice());
    return PoolBalance::deserialize(sit);
}

void
writePoolBalance(ApplyView& view, PoolBalance const& balance)
{
    ripple::Serializer s;
    balance.serialize(s);

    auto const k = keylet::poolBalance();
    if (auto sle = view.peek(k))
    {
        sle->setData(s.peekData());
        view.update(sle);
    }
    else
    {
        view.insert(std::make_shared<StateEntry>(k, s.peekData()));
    }
}

}  // namespace shieldpay
