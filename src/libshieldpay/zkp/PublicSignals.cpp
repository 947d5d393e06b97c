#include <libshieldpay/zkp/PublicSignals.h>

#include <algorithm>

namespace shieldpay {
namespace zkp {

namespace {

Expected<std::uint64_t, TER>
readLittleEndian(uint256 const& value, std::size_t width)
{
    auto const* bytes = value.data();

    if (!std::all_of(bytes + width, bytes + fieldBytes, [](std::uint8_t b) {
            return b == 0;
        }))
        return Unexpected(tecARITHMETIC);

    std::uint64_t result = 0;
    for (std::size_t i = width; i-- > 0;)
        result = (result << 8) | bytes[i];
    return result;
}

}  // namespace

Expected<PublicSignals, TER>
PublicSignals::fromWire(Slice bytes, std::size_t count)
{
    auto decoded = decodePublicSignals(bytes, count);
    if (!decoded)
        return Unexpected(decoded.error());
    return PublicSignals(std::move(*decoded));
}

Expected<std::uint32_t, TER>
PublicSignals::asU32(std::size_t index) const
{
    auto const v = readLittleEndian(values_.at(index), sizeof(std::uint32_t));
    if (!v)
        return Unexpected(v.error());
    return static_cast<std::uint32_t>(*v);
}

Expected<std::uint64_t, TER>
PublicSignals::asU64(std::size_t index) const
{
    return readLittleEndian(values_.at(index), sizeof(std::uint64_t));
}

uint256
signalFromInt(std::uint64_t value)
{
    uint256 out;
    for (std::size_t i = 0; i < sizeof(value); ++i)
    {
        out.data()[i] = static_cast<std::uint8_t>(value & 0xff);
        value >>= 8;
    }
    return out;
}

uint256
signalFromAccount(ripple::AccountID const& account)
{
    uint256 out;
    std::reverse_copy(account.begin(), account.end(), out.begin());
    return out;
}

}  // namespace zkp
}  // namespace shieldpay
