#include <libshieldpay/zkp/VerifyingKeyRegistry.h>

#include <xrpl/basics/contract.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace shieldpay {
namespace zkp {

namespace {

// The last signal each layout reads, named so an undersized key is easy to
// trace back to the circuit it was exported from.
std::string
layoutTail(Circuit circuit)
{
    switch (circuit)
    {
        case Circuit::deposit:
            return "deposit signals end with the old root at index 6";
        case Circuit::transfer:
            return "transfer signals end with the second encrypted note "
                   "at index 8";
        case Circuit::withdraw:
            return "withdraw signals end with the token id at index 4";
    }
    return to_string(circuit);
}

}  // namespace

VerifyingKeyRegistry::VerifyingKeyRegistry(
    std::map<Circuit, Blob> const& blobs,
    CodecOptions const& options)
{
    for (auto const& [circuit, blob] : blobs)
    {
        auto vk = parseVerifyingKey(ripple::makeSlice(blob));
        if (!vk)
            ripple::Throw<std::runtime_error>(
                "malformed " + to_string(circuit) + " verifying key (" +
                std::to_string(blob.size()) + " bytes)");

        if (vk->publicInputCount() < minimumArity(circuit))
            ripple::Throw<std::runtime_error>(
                to_string(circuit) + " verifying key has " +
                std::to_string(vk->publicInputCount()) +
                " public signals (" + std::to_string(vk->ic.size()) +
                " IC points), at least " +
                std::to_string(minimumArity(circuit)) + " required: " +
                layoutTail(circuit));

        applyG2Order(*vk, options);
        keys_[static_cast<std::size_t>(circuit)] = std::move(*vk);
    }
}

VerifyingKeyRegistry
VerifyingKeyRegistry::fromFiles(
    std::map<Circuit, std::string> const& paths,
    CodecOptions const& options)
{
    std::map<Circuit, Blob> blobs;
    for (auto const& [circuit, path] : paths)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
            ripple::Throw<std::runtime_error>(
                "cannot open " + to_string(circuit) + " verifying key " + path);

        blobs[circuit] = Blob(
            (std::istreambuf_iterator<char>(file)),
            std::istreambuf_iterator<char>());
    }
    return VerifyingKeyRegistry(blobs, options);
}

VerifyingKey const*
VerifyingKeyRegistry::find(Circuit circuit) const
{
    auto const& slot = keys_[static_cast<std::size_t>(circuit)];
    return slot ? &*slot : nullptr;
}

std::size_t
VerifyingKeyRegistry::publicInputCount(Circuit circuit) const
{
    if (auto const vk = find(circuit))
        return vk->publicInputCount();
    return minimumArity(circuit);
}

}  // namespace zkp
}  // namespace shieldpay
