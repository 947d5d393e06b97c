#ifndef SHIELDPAY_TX_BUNDLE_H_INCLUDED
#define SHIELDPAY_TX_BUNDLE_H_INCLUDED

#include <xrpl/basics/Blob.h>
#include <xrpl/protocol/AccountID.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace shieldpay {

using ripple::AccountID;
using ripple::Blob;

/** One sibling operation of the atomic unit a shielded call executes in. */
struct BundleOperation
{
    enum class Kind {
        transfer,         // plain value transfer
        transferChecked,  // value transfer that also states the decimals
        memo,             // free-form payload
        other,
    };

    Kind kind = Kind::other;
    std::optional<AccountID> source;
    std::optional<AccountID> destination;
    std::uint64_t amount = 0;
    std::optional<std::uint8_t> decimals;
    Blob payload;

    static BundleOperation
    makeTransfer(AccountID const& from, AccountID const& to, std::uint64_t amount);

    static BundleOperation
    makeTransferChecked(
        AccountID const& from,
        AccountID const& to,
        std::uint64_t amount,
        std::uint8_t decimals);

    static BundleOperation
    makeMemo(Blob payload);
};

/** Read access to the operations of the enclosing atomic unit.

    Only operations at or before the one currently executing are visible.
*/
class BundleInspector
{
public:
    using Predicate = std::function<bool(BundleOperation const&)>;

    virtual ~BundleInspector() = default;

    /** First visible operation satisfying `pred`, if any. */
    virtual std::optional<BundleOperation>
    find(Predicate const& pred) const = 0;
};

/** A bundle held in memory, positioned at one of its operations. */
class TransactionBundle : public BundleInspector
{
public:
    TransactionBundle() = default;

    /** Append an operation and return its index. */
    std::size_t
    add(BundleOperation op);

    /** Position the bundle at the operation now executing. */
    void
    setCurrent(std::size_t index);

    std::size_t
    current() const
    {
        return current_;
    }

    std::size_t
    size() const
    {
        return ops_.size();
    }

    std::optional<BundleOperation>
    find(Predicate const& pred) const override;

private:
    std::vector<BundleOperation> ops_;
    std::size_t current_ = 0;
};

}  // namespace shieldpay

#endif
