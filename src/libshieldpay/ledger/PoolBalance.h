#ifndef SHIELDPAY_LEDGER_POOLBALANCE_H_INCLUDED
#define SHIELDPAY_LEDGER_POOLBALANCE_H_INCLUDED

#include <libshieldpay/ledger/ReadView.h>
#include <libshieldpay/protocol/TER.h>

#include <xrpl/protocol/Serializer.h>

#include <cstdint>
#include <optional>

namespace shieldpay {

/** Value the pool holds on behalf of shielded notes.

    The vault account may hold more than this; withdrawals are limited to
    what deposits brought in. Arithmetic is checked and never wraps.
*/
class PoolBalance
{
public:
    PoolBalance() = default;

    PoolBalance(
        std::uint64_t totalDeposited,
        std::uint64_t totalWithdrawn,
        std::uint64_t balance)
        : deposited_(totalDeposited)
        , withdrawn_(totalWithdrawn)
        , balance_(balance)
    {
    }

    /** Record a deposit.

        @return tecARITHMETIC if a total would overflow; nothing changes.
    */
    TER
    credit(std::uint64_t amount);

    /** Record a withdrawal.

        @return tecINSUFFICIENT_FUNDS if `amount` exceeds the balance,
                tecARITHMETIC on overflow; nothing changes on failure.
    */
    TER
    debit(std::uint64_t amount);

    std::uint64_t
    totalDeposited() const
    {
        return deposited_;
    }

    std::uint64_t
    totalWithdrawn() const
    {
        return withdrawn_;
    }

    std::uint64_t
    balance() const
    {
        return balance_;
    }

    void
    serialize(ripple::Serializer& s) const;

    /** @throws std::runtime_error if the totals are inconsistent. */
    static PoolBalance
    deserialize(ripple::SerialIter& sit);

private:
    std::uint64_t deposited_ = 0;
    std::uint64_t withdrawn_ = 0;
    std::uint64_t balance_ = 0;
};

std::optional<PoolBalance>
readPoolBalance(ReadView const& view);

void
writePoolBalance(ApplyView& view, PoolBalance const& balance);

}  // namespace shieldpay

#endif
