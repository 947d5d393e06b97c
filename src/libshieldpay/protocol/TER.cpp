#include <libshieldpay/protocol/TER.h>

#include <unordered_map>
#include <utility>

namespace shieldpay {

namespace detail {

static std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off
    static std::unordered_map<
        TERUnderlyingType,
        std::pair<char const* const, char const* const>> const results
    {
#define MAKE_ERROR(code, desc) { code, { #code, desc } }

        MAKE_ERROR(temMALFORMED,                  "Malformed request."),
        MAKE_ERROR(temBAD_PROOF_LENGTH,           "Proof must be exactly 256 bytes."),
        MAKE_ERROR(temBAD_PUBLIC_INPUTS_LENGTH,   "Public signals do not match the circuit arity."),
        MAKE_ERROR(temBAD_VERIFYING_KEY,          "Verifying key blob is malformed."),
        MAKE_ERROR(temPAYLOAD_MISMATCH,           "Supplied tag does not match the proof's public signal."),
        MAKE_ERROR(temBAD_AMOUNT,                 "Amount is zero or out of range."),

        MAKE_ERROR(tefFAILURE,                    "Failed to apply."),
        MAKE_ERROR(tefBAD_PROOF,                  "Proof does not verify."),

        MAKE_ERROR(terRETRY,                      "Retry operation."),
        MAKE_ERROR(terOLD_ROOT_MISMATCH,          "Proof was built against a different tree root."),
        MAKE_ERROR(terLEAF_INDEX_MISMATCH,        "Proof claims the wrong next leaf index."),
        MAKE_ERROR(terUNKNOWN_ROOT,               "Root is not in the recent root history."),
        MAKE_ERROR(terNO_TREE,                    "Commitment tree has not been initialized."),

        MAKE_ERROR(tesSUCCESS,                    "The operation was applied."),

        MAKE_ERROR(tecNULLIFIER_USED,             "Nullifier has already been consumed."),
        MAKE_ERROR(tecMISSING_COMPANION_TRANSFER, "No matching value transfer to the vault in this bundle."),
        MAKE_ERROR(tecMISSING_MEMO,               "No memo carrying the deposit hash in this bundle."),
        MAKE_ERROR(tecARITHMETIC,                 "Arithmetic overflow."),
        MAKE_ERROR(tecTREE_FULL,                  "Commitment tree has no free leaves."),
        MAKE_ERROR(tecDUPLICATE,                  "Record already exists."),
        MAKE_ERROR(tecVALUE_MOVE_FAILED,          "Value movement from the vault failed."),
        MAKE_ERROR(tecINTERNAL,                   "An internal error has occurred."),
        MAKE_ERROR(tecINSUFFICIENT_FUNDS,         "Pool balance is lower than the withdrawal."),
    };
    // clang-format on

#undef MAKE_ERROR

    return results;
}

}  // namespace detail

bool
transResultInfo(TER code, std::string& token, std::string& text)
{
    auto& results = detail::transResults();

    auto const r = results.find(TERtoInt(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<TER>
TER::fromInt(TERUnderlyingType from)
{
    auto& results = detail::transResults();
    if (results.find(from) == results.end())
        return std::nullopt;

    TER ret;
    ret.code_ = from;
    return ret;
}

}  // namespace shieldpay
