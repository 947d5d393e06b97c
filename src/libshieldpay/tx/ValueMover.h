#ifndef SHIELDPAY_TX_VALUEMOVER_H_INCLUDED
#define SHIELDPAY_TX_VALUEMOVER_H_INCLUDED

#include <libshieldpay/protocol/TER.h>

#include <xrpl/protocol/AccountID.h>

#include <cstdint>

namespace shieldpay {

/** Moves value between accounts on behalf of the pool.

    The pool signs for its vault; the host decides what an account and an
    amount are. A withdrawal that cannot be paid is rolled back.
*/
class ValueMover
{
public:
    virtual ~ValueMover() = default;

    virtual TER
    move(
        ripple::AccountID const& from,
        ripple::AccountID const& to,
        std::uint64_t amount) = 0;
};

}  // namespace shieldpay

#endif
