#ifndef SHIELDPAY_LEDGER_MEMORYVIEW_H_INCLUDED
#define SHIELDPAY_LEDGER_MEMORYVIEW_H_INCLUDED

#include <libshieldpay/ledger/ReadView.h>

#include <map>

namespace shieldpay {

/** State store kept in memory.

    Each committed write bumps the record's version. Hosts that persist
    state elsewhere implement ApplyView over their own storage instead.
*/
class MemoryView : public ApplyView
{
public:
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

    std::size_t
    size() const
    {
        return entries_.size();
    }

private:
    std::map<uint256, std::shared_ptr<StateEntry const>> entries_;
};

}  // namespace shieldpay

#endif
