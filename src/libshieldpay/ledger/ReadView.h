#ifndef SHIELDPAY_LEDGER_READVIEW_H_INCLUDED
#define SHIELDPAY_LEDGER_READVIEW_H_INCLUDED

#include <libshieldpay/ledger/StateEntry.h>

#include <memory>

namespace shieldpay {

/** A read-only view of the state store. */
class ReadView
{
public:
    virtual ~ReadView() = default;

    /** Determine if a record exists at the keylet. */
    virtual bool
    exists(Keylet const& k) const = 0;

    /** Return the record at the keylet, or nullptr.

        A record whose type does not match the keylet is not returned.
    */
    virtual std::shared_ptr<StateEntry const>
    read(Keylet const& k) const = 0;
};

/** A view that can be written to.

    Records obtained through peek are copies; changes become visible
    through update.
*/
class ApplyView : public ReadView
{
public:
    /** Return a modifiable copy of the record at the keylet, or nullptr. */
    virtual std::shared_ptr<StateEntry>
    peek(Keylet const& k) = 0;

    /** Create a new record.

        @throws std::logic_error if a record already exists at the key.
    */
    virtual void
    insert(std::shared_ptr<StateEntry> const& entry) = 0;

    /** Replace an existing record.

        @throws std::logic_error if no record exists at the key.
    */
    virtual void
    update(std::shared_ptr<StateEntry> const& entry) = 0;
};

}  // namespace shieldpay

#endif
