#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace shieldpay {
namespace zkp {

/** The three circuits the pool accepts proofs for. */
enum class Circuit : std::uint8_t { deposit = 0, transfer = 1, withdraw = 2 };

constexpr std::array<Circuit, 3> allCircuits{
    Circuit::deposit, Circuit::transfer, Circuit::withdraw};

// Positions of the public signals each circuit exposes.

namespace depositSignal {
constexpr std::size_t newCommitment = 0;
constexpr std::size_t owner = 1;
constexpr std::size_t newRoot = 2;
constexpr std::size_t nextLeafIndex = 3;
constexpr std::size_t amount = 4;
constexpr std::size_t depositHash = 5;
constexpr std::size_t oldRoot = 6;
constexpr std::size_t count = 7;
}  // namespace depositSignal

namespace transferSignal {
constexpr std::size_t outCommitment1 = 0;
constexpr std::size_t outCommitment2 = 1;
constexpr std::size_t nullifier = 2;
constexpr std::size_t spentRoot = 3;
constexpr std::size_t newRoot1 = 4;
constexpr std::size_t newRoot2 = 5;
constexpr std::size_t nextLeafIndex = 6;
constexpr std::size_t encryptedNote1 = 7;
constexpr std::size_t encryptedNote2 = 8;
constexpr std::size_t count = 9;
}  // namespace transferSignal

namespace withdrawSignal {
constexpr std::size_t nullifier = 0;
constexpr std::size_t merkleRoot = 1;
constexpr std::size_t recipient = 2;
constexpr std::size_t amount = 3;
constexpr std::size_t tokenId = 4;
constexpr std::size_t count = 5;
}  // namespace withdrawSignal

/** Smallest public input count a key for `circuit` may declare. */
std::size_t
minimumArity(Circuit circuit);

std::string
to_string(Circuit circuit);

}  // namespace zkp
}  // namespace shieldpay
