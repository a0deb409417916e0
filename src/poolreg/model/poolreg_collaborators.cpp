#include "poolreg_collaborators.hpp"
#include "poolreg_errors.hpp"
#include "../commons/poolreg_log.hpp"

namespace poolreg {
namespace model {


const SwapEngine &ContractDirectory::require_swap_engine(const address_t &address) const
{
    auto res = swap_engine(address);
    require<NoSuchContract>(res != nullptr, strfmt("no swap engine at %1%", address));
    return *res;
}

const DepositWrapper &ContractDirectory::require_deposit_wrapper(const address_t &address) const
{
    auto res = deposit_wrapper(address);
    require<NoSuchContract>(res != nullptr, strfmt("no deposit wrapper at %1%", address));
    return *res;
}


void ContractBook::add_swap_engine(const address_t &address, std::shared_ptr<const SwapEngine> engine)
{
    require<InvalidIdentifier>(!address.is_null(), "swap engine address can't be null");
    require<ValidationError>(engine != nullptr, "swap engine can't be null");
    m_engines[address] = std::move(engine);
}

void ContractBook::add_deposit_wrapper(const address_t &address, std::shared_ptr<const DepositWrapper> wrapper)
{
    require<InvalidIdentifier>(!address.is_null(), "deposit wrapper address can't be null");
    require<ValidationError>(wrapper != nullptr, "deposit wrapper can't be null");
    m_wrappers[address] = std::move(wrapper);
}

void ContractBook::set_total_supply(const address_t &token, const balance_t &supply)
{
    m_supplies[token] = supply;
}

const SwapEngine *ContractBook::swap_engine(const address_t &address) const
{
    auto i = m_engines.find(address);
    return i == m_engines.end() ? nullptr : i->second.get();
}

const DepositWrapper *ContractBook::deposit_wrapper(const address_t &address) const
{
    auto i = m_wrappers.find(address);
    return i == m_wrappers.end() ? nullptr : i->second.get();
}

balance_t ContractBook::total_supply(const address_t &token) const
{
    auto i = m_supplies.find(token);
    return i == m_supplies.end() ? balance_t(0) : i->second;
}


TokenProbe::TokenProbe(probe_fn probe, unsigned cap, const address_t &contract)
    : m_probe(std::move(probe))
    , m_cap(cap)
    , m_contract(contract)
{ }

bool TokenProbe::next(address_t &out)
{
    if (m_exhausted || m_position >= m_cap)
    {
        m_exhausted = true;
        return false;
    }

    auto token = m_probe(m_position);
    if (!token)
    {
        log_trace("%1%: no token at slot %2%, %2% token(s) found", m_contract, m_position);
        m_exhausted = true;
        return false;
    }

    require<ZeroToken>(!token->is_null()
                       , strfmt("%1%: null token at slot %2%", m_contract, m_position));
    out = *token;
    ++m_position;
    return true;
}


SwapStorage fetch_swap_storage(const SwapEngine &engine, const address_t &engine_address)
{
    auto primary = engine.swap_storage();
    if (primary)
    {
        return *primary;
    }

    auto guarded = engine.guarded_swap_storage();
    if (guarded)
    {
        log_debug("%1%: using guarded swap storage", engine_address);
        return guarded->as_swap_storage();
    }

    throw NoParameterData(strfmt("%1%: no swap storage available", engine_address));
}


} // namespace model
} // namespace poolreg
