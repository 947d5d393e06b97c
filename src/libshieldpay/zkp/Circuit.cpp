#include <libshieldpay/zkp/Circuit.h>

#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace shieldpay {
namespace zkp {

std::size_t
minimumArity(Circuit circuit)
{
    switch (circuit)
    {
        case Circuit::deposit:
            return depositSignal::count;
        case Circuit::transfer:
            return transferSignal::count;
        case Circuit::withdraw:
            return withdrawSignal::count;
    }
    ripple::Throw<std::invalid_argument>("minimumArity: unknown circuit");
    return 0;
}

std::string
to_string(Circuit circuit)
{
    switch (circuit)
    {
        case Circuit::deposit:
            return "deposit";
        case Circuit::transfer:
            return "transfer";
        case Circuit::withdraw:
            return "withdraw";
    }
    return "unknown";
}

}  // namespace zkp
}  // namespace shieldpay
