#ifndef SHIELDPAY_TX_RECEIPTS_H_INCLUDED
#define SHIELDPAY_TX_RECEIPTS_H_INCLUDED

#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/AccountID.h>

#include <cstdint>

namespace shieldpay {

using ripple::uint256;

// What each successful operation reports back to the host.

struct DepositReceipt
{
    uint256 depositHash;
    uint256 ownerTag;
    uint256 commitment;
    uint256 newRoot;
    std::uint32_t nextLeafIndex = 0;
    std::uint64_t amount = 0;

    // Set when the hash had been credited before; nothing changed.
    bool alreadyProcessed = false;
};

struct TransferReceipt
{
    uint256 nullifier;
    uint256 outCommitment1;
    uint256 outCommitment2;
    uint256 encryptedNote1;
    uint256 encryptedNote2;
    uint256 newRoot1;
    uint256 newRoot2;
    std::uint32_t nextLeafIndex = 0;
};

struct WithdrawReceipt
{
    uint256 nullifier;
    uint256 merkleRoot;
    uint256 recipientTag;
    uint256 tokenId;
    ripple::AccountID recipient;
    std::uint64_t amount = 0;
};

}  // namespace shieldpay

#endif
