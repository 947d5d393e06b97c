#include <libshieldpay/protocol/Keylet.h>

#include <xrpl/protocol/digest.h>

namespace shieldpay {

/** Namespace prefixes mixed into every record key.

    Distinct prefixes keep a nullifier tag and a deposit hash with the same
    bytes from ever landing on the same key.
*/
enum class LedgerNameSpace : std::uint16_t {
    COMMITMENT_TREE = 'T',
    ROOT_CACHE = 'R',
    NULLIFIER = 'N',
    DEPOSIT_MARKER = 'D',
    POOL_BALANCE = 'V',
};

template <class... Args>
static uint256
indexHash(LedgerNameSpace space, Args const&... args)
{
    return ripple::sha512Half(static_cast<std::uint16_t>(space), args...);
}

namespace keylet {

Keylet
commitmentTree() noexcept
{
    static Keylet const ret{
        ltCOMMITMENT_TREE, indexHash(LedgerNameSpace::COMMITMENT_TREE)};
    return ret;
}

Keylet
rootCache() noexcept
{
    static Keylet const ret{
        ltROOT_CACHE, indexHash(LedgerNameSpace::ROOT_CACHE)};
    return ret;
}

Keylet
nullifier(uint256 const& tag) noexcept
{
    return {ltNULLIFIER, indexHash(LedgerNameSpace::NULLIFIER, tag)};
}

Keylet
depositMarker(uint256 const& depositHash) noexcept
{
    return {
        ltDEPOSIT_MARKER, indexHash(LedgerNameSpace::DEPOSIT_MARKER, depositHash)};
}

Keylet
poolBalance() noexcept
{
    static Keylet const ret{
        ltPOOL_BALANCE, indexHash(LedgerNameSpace::POOL_BALANCE)};
    return ret;
}

}  // namespace keylet

}  // namespace shieldpay
