#include <libshieldpay/ledger/MemoryView.h>

#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace shieldpay {

bool
MemoryView::exists(Keylet const& k) const
{
    return read(k) != nullptr;
}

std::shared_ptr<StateEntry const>
MemoryView::read(Keylet const& k) const
{
    auto const iter = entries_.find(k.key);
    if (iter == entries_.end() || !k.check(iter->second->getType()))
        return nullptr;
    return iter->second;
}

std::shared_ptr<StateEntry>
MemoryView::peek(Keylet const& k)
{
    auto const sle = read(k);
    if (!sle)
        return nullptr;
    return std::make_shared<StateEntry>(*sle);
}

void
MemoryView::insert(std::shared_ptr<StateEntry> const& entry)
{
    auto copy = std::make_shared<StateEntry>(*entry);
    copy->setVersion(1);
    if (!entries_.emplace(entry->key(), std::move(copy)).second)
        ripple::Throw<std::logic_error>("MemoryView::insert: key exists");
}

void
MemoryView::update(std::shared_ptr<StateEntry> const& entry)
{
    auto const iter = entries_.find(entry->key());
    if (iter == entries_.end())
        ripple::Throw<std::logic_error>("MemoryView::update: key missing");

    auto copy = std::make_shared<StateEntry>(*entry);
    copy->setVersion(iter->second->version() + 1);
    iter->second = std::move(copy);
}

}  // namespace shieldpay
