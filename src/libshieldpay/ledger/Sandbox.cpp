#include <libshieldpay/ledger/Sandbox.h>

#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace shieldpay {

bool
Sandbox::exists(Keylet const& k) const
{
    return read(k) != nullptr;
}

std::shared_ptr<StateEntry const>
Sandbox::read(Keylet const& k) const
{
    auto const iter = items_.find(k.key);
    if (iter == items_.end())
        return parent_.read(k);
    if (!k.check(iter->second.entry->getType()))
        return nullptr;
    return iter->second.entry;
}

std::shared_ptr<StateEntry>
Sandbox::peek(Keylet const& k)
{
    auto const sle = read(k);
    if (!sle)
        return nullptr;
    return std::make_shared<StateEntry>(*sle);
}

void
Sandbox::insert(std::shared_ptr<StateEntry> const& entry)
{
    auto const iter = items_.find(entry->key());
    if (iter != items_.end() ||
        parent_.exists(Keylet(entry->getType(), entry->key())))
        ripple::Throw<std::logic_error>("Sandbox::insert: key exists");

    items_.emplace(
        entry->key(),
        Item{Action::insert, std::make_shared<StateEntry const>(*entry)});
}

void
Sandbox::update(std::shared_ptr<StateEntry> const& entry)
{
    auto copy = std::make_shared<StateEntry const>(*entry);

    auto const iter = items_.find(entry->key());
    if (iter != items_.end())
    {
        // An insert followed by an update is still an insert.
        iter->second.entry = std::move(copy);
        return;
    }

    if (!parent_.exists(Keylet(entry->getType(), entry->key())))
        ripple::Throw<std::logic_error>("Sandbox::update: key missing");

    items_.emplace(entry->key(), Item{Action::modify, std::move(copy)});
}

void
Sandbox::apply(ApplyView& to)
{
    for (auto const& [key, item] : items_)
    {
        auto entry = std::make_shared<StateEntry>(*item.entry);
        if (item.action == Action::insert)
            to.insert(entry);
        else
            to.update(entry);
    }
    items_.clear();
}

}  // namespace shieldpay
