#include <libshieldpay/tx/Bundle.h>

#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace shieldpay {

BundleOperation
BundleOperation::makeTransfer(
    AccountID const& from,
    AccountID const& to,
    std::uint64_t amount)
{
    BundleOperation op;
    op.kind = Kind::transfer;
    op.source = from;
    op.destination = to;
    op.amount = amount;
    return op;
}

BundleOperation
BundleOperation::makeTransferChecked(
    AccountID const& from,
    AccountID const& to,
    std::uint64_t amount,
    std::uint8_t decimals)
{
    auto op = makeTransfer(from, to, amount);
    op.kind = Kind::transferChecked;
    op.decimals = decimals;
    return op;
}

BundleOperation
BundleOperation::makeMemo(Blob payload)
{
    BundleOperation op;
    op.kind = Kind::memo;
    op.payload = std::move(payload);
    return op;
}

std::size_t
TransactionBundle::add(BundleOperation op)
{
    ops_.push_back(std::move(op));
    return ops_.size() - 1;
}

void
TransactionBundle::setCurrent(std::size_t index)
{
    if (index >= ops_.size())
        ripple::Throw<std::out_of_range>("TransactionBundle: bad index");
    current_ = index;
}

std::optional<BundleOperation>
TransactionBundle::find(Predicate const& pred) const
{
    if (ops_.empty())
        return std::nullopt;

    for (std::size_t i = 0; i <= current_; ++i)
    {
        if (pred(ops_[i]))
            return ops_[i];
    }
    return std::nullopt;
}

}  // namespace shieldpay
