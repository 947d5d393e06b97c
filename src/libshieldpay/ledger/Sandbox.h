#ifndef SHIELDPAY_LEDGER_SANDBOX_H_INCLUDED
#define SHIELDPAY_LEDGER_SANDBOX_H_INCLUDED

#include <libshieldpay/ledger/ReadView.h>

#include <map>

namespace shieldpay {

/** Discardable, editable view on top of another view.

    Writes are buffered until apply() pushes all of them into the parent.
    Destroying the sandbox without calling apply() leaves the parent as it
    was, so an operation that fails half way commits nothing.
*/
class Sandbox : public ApplyView
{
public:
    explicit Sandbox(ApplyView& parent) : parent_(parent)
    {
    }

    Sandbox(Sandbox const&) = delete;
    Sandbox&
    operator=(Sandbox const&) = delete;

    bool
    exists(Keylet const& k) const override;

    std::shared_ptr<StateEntry const>
    read(Keylet const& k) const override;

    std::shared_ptr<StateEntry>
    peek(Keylet const& k) override;

    void
    insert(std::shared_ptr<StateEntry> const& entry) override;

    void
    update(std::shared_ptr<StateEntry> const& entry) override;

    /** Commit every buffered write to `to`. */
    void
    apply(ApplyView& to);

    /** Commit every buffered write to the parent view. */
    void
    apply()
    {
        apply(parent_);
    }

    std::size_t
    pending() const
    {
        return items_.size();
    }

private:
    enum class Action { insert, modify };

    struct Item
    {
        Action action;
        std::shared_ptr<StateEntry const> entry;
    };

    ApplyView& parent_;
    std::map<uint256, Item> items_;
};

}  // namespace shieldpay

#endif
