#pragma once

#include <libshieldpay/zkp/Circuit.h>
#include <libshieldpay/zkp/VerifyingKey.h>

#include <array>
#include <map>
#include <optional>
#include <string>

namespace shieldpay {
namespace zkp {

/** The verifying keys of the deployed circuits.

    Keys are loaded exactly once, when the registry is built, and are
    read-only afterwards. Every problem with a key is fatal at that point:
    a malformed blob, too many IC points, or an IC count that cannot carry
    the public signals the circuit is known to expose. Stored keys are
    already in the engine's G2 limb order.
*/
class VerifyingKeyRegistry
{
public:
    VerifyingKeyRegistry() = default;

    /** Build from serialized key blobs.

        @throws std::runtime_error on any invalid key.
    */
    VerifyingKeyRegistry(
        std::map<Circuit, Blob> const& blobs,
        CodecOptions const& options);

    /** Build from key files on disk.

        @throws std::runtime_error if a file cannot be read or holds an
                invalid key.
    */
    static VerifyingKeyRegistry
    fromFiles(
        std::map<Circuit, std::string> const& paths,
        CodecOptions const& options);

    /** The key for a circuit, or nullptr when none was configured. */
    VerifyingKey const*
    find(Circuit circuit) const;

    /** Number of public signals a proof for `circuit` carries.

        Taken from the key's IC count; circuits without a key report the
        layout minimum.
    */
    std::size_t
    publicInputCount(Circuit circuit) const;

private:
    std::array<std::optional<VerifyingKey>, allCircuits.size()> keys_;
};

}  // namespace zkp
}  // namespace shieldpay
