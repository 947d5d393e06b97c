#include <libshieldpay/core/PoolConfig.h>

#include <libshieldpay/ledger/CommitmentTree.h>

#include <xrpl/basics/contract.h>

#include <boost/lexical_cast.hpp>

#include <stdexcept>

namespace shieldpay {

namespace {

template <class T>
std::optional<T>
getValue(ripple::Section const& section, std::string const& name)
{
    try
    {
        return section.get<T>(name);
    }
    catch (boost::bad_lexical_cast const&)
    {
        ripple::Throw<std::runtime_error>(
            "Invalid value for '" + name + "' in [" + SECTION_SHIELDED_POOL +
            "]");
    }
    return std::nullopt;
}

bool
getFlag(ripple::Section const& section, std::string const& name, bool def)
{
    if (auto const v = getValue<int>(section, name))
    {
        if (*v != 0 && *v != 1)
            ripple::Throw<std::runtime_error>(
                "'" + name + "' in [" + SECTION_SHIELDED_POOL +
                "] must be 0 or 1");
        return *v == 1;
    }
    return def;
}

}  // namespace

PoolConfig
setupPoolConfig(ripple::Section const& section)
{
    PoolConfig config;

    if (auto const verifier = getValue<std::string>(section, "verifier"))
    {
        if (*verifier == "groth16")
            config.verifier = PoolConfig::Verifier::groth16;
        else if (*verifier == "format_only")
            config.verifier = PoolConfig::Verifier::formatOnly;
        else
            ripple::Throw<std::runtime_error>(
                "Unknown verifier '" + *verifier + "' in [" +
                SECTION_SHIELDED_POOL + "]");
    }

    config.codec.negateProofA =
        getFlag(section, "negate_proof_a", config.codec.negateProofA);
    config.codec.swapProofB =
        getFlag(section, "swap_proof_b", config.codec.swapProofB);
    config.codec.swapVkG2 =
        getFlag(section, "swap_vk_g2", config.codec.swapVkG2);

    if (auto const capacity =
            getValue<std::uint32_t>(section, "root_cache_capacity"))
    {
        if (*capacity == 0 || *capacity > maxRootCacheCapacity)
            ripple::Throw<std::runtime_error>(
                "root_cache_capacity must be between 1 and " +
                std::to_string(maxRootCacheCapacity));
        config.rootCacheCapacity = *capacity;
    }

    if (auto const depth = getValue<int>(section, "tree_depth"))
    {
        if (*depth < 1 || *depth > maxTreeDepth)
            ripple::Throw<std::runtime_error>(
                "tree_depth must be between 1 and " +
                std::to_string(maxTreeDepth));
        config.treeDepth = static_cast<std::uint8_t>(*depth);
    }

    auto const vault = getValue<std::string>(section, "vault");
    if (!vault)
        ripple::Throw<std::runtime_error>(
            std::string("Missing 'vault' in [") + SECTION_SHIELDED_POOL + "]");
    if (auto const id = ripple::parseBase58<ripple::AccountID>(*vault))
        config.vault = *id;
    else
        ripple::Throw<std::runtime_error>("Invalid vault account " + *vault);

    config.allowAnyDepositAmount = getFlag(
        section, "allow_any_deposit_amount", config.allowAnyDepositAmount);

    for (auto const circuit : zkp::allCircuits)
    {
        auto const key = zkp::to_string(circuit) + "_vk";
        if (auto const path = getValue<std::string>(section, key))
            config.keyFiles[circuit] = *path;
    }

    if (config.verifier == PoolConfig::Verifier::groth16 &&
        config.keyFiles.size() != zkp::allCircuits.size())
        ripple::Throw<std::runtime_error>(
            "verifier=groth16 needs deposit_vk, transfer_vk and withdraw_vk");

    return config;
}

}  // namespace shieldpay
