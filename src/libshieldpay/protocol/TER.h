#ifndef SHIELDPAY_PROTOCOL_TER_H_INCLUDED
#define SHIELDPAY_PROTOCOL_TER_H_INCLUDED

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace shieldpay {

using TERUnderlyingType = int;

//------------------------------------------------------------------------------

/** Malformed request. Never retried, nothing was looked up in state. */
enum TEMcodes : TERUnderlyingType {
    temMALFORMED = -299,

    temBAD_PROOF_LENGTH,
    temBAD_PUBLIC_INPUTS_LENGTH,
    temBAD_VERIFYING_KEY,
    temPAYLOAD_MISMATCH,
    temBAD_AMOUNT,
};

/** Proof rejected. One opaque outcome for every verification failure. */
enum TEFcodes : TERUnderlyingType {
    tefFAILURE = -199,
    tefBAD_PROOF,
};

/** State-sync failure. The client may rebuild the proof and retry. */
enum TERcodes : TERUnderlyingType {
    terRETRY = -99,
    terOLD_ROOT_MISMATCH,
    terLEAF_INDEX_MISMATCH,
    terUNKNOWN_ROOT,
    terNO_TREE,
};

enum TEScodes : TERUnderlyingType {
    tesSUCCESS = 0
};

/** Rejected against current state. */
enum TECcodes : TERUnderlyingType {
    tecNULLIFIER_USED = 100,
    tecMISSING_COMPANION_TRANSFER = 101,
    tecMISSING_MEMO = 102,
    tecARITHMETIC = 103,
    tecTREE_FULL = 104,
    tecDUPLICATE = 105,
    tecVALUE_MOVE_FAILED = 106,
    tecINTERNAL = 107,
    tecINSUFFICIENT_FUNDS = 108,
};

//------------------------------------------------------------------------------

class TER
{
private:
    TERUnderlyingType code_;

public:
    constexpr TER() : code_(tesSUCCESS)
    {
    }

    constexpr TER(TEMcodes code) : code_(code)
    {
    }
    constexpr TER(TEFcodes code) : code_(code)
    {
    }
    constexpr TER(TERcodes code) : code_(code)
    {
    }
    constexpr TER(TEScodes code) : code_(code)
    {
    }
    constexpr TER(TECcodes code) : code_(code)
    {
    }

    static std::optional<TER>
    fromInt(TERUnderlyingType from);

    friend constexpr TERUnderlyingType
    TERtoInt(TER v)
    {
        return v.code_;
    }

    friend constexpr bool
    operator==(TER lhs, TER rhs)
    {
        return lhs.code_ == rhs.code_;
    }

    friend constexpr bool
    operator!=(TER lhs, TER rhs)
    {
        return lhs.code_ != rhs.code_;
    }

    friend std::ostream&
    operator<<(std::ostream& os, TER const& t)
    {
        return os << t.code_;
    }
};

inline bool
isTemMalformed(TER x)
{
    return TERtoInt(x) >= temMALFORMED && TERtoInt(x) < tefFAILURE;
}

inline bool
isTefFailure(TER x)
{
    return TERtoInt(x) >= tefFAILURE && TERtoInt(x) < terRETRY;
}

inline bool
isTerRetry(TER x)
{
    return TERtoInt(x) >= terRETRY && TERtoInt(x) < tesSUCCESS;
}

inline bool
isTesSuccess(TER x)
{
    return TERtoInt(x) == tesSUCCESS;
}

inline bool
isTecClaim(TER x)
{
    return TERtoInt(x) >= tecNULLIFIER_USED;
}

bool
transResultInfo(TER code, std::string& token, std::string& text);

std::string
transToken(TER code);

std::string
transHuman(TER code);

}  // namespace shieldpay

#endif
