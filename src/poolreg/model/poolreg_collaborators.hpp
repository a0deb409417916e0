/**
 * @file poolreg_collaborators.hpp
 * @brief Contracts the registries talk to, but do not implement.
 *
 * The pool registry never holds swap engines itself: it resolves them by
 * address through a ContractDirectory, every time it needs to probe one.
 * ContractBook is the plain in-memory directory; hosts with their own
 * notion of "the chain" implement ContractDirectory directly.
 */

#pragma once

#include "poolreg_model_fwd.hpp"
#include "poolreg_model.hpp"
#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>
#include <functional>
#include <memory>
#include <unordered_map>


namespace poolreg {
namespace model {


/**
 * @brief Asset custody / exchange engine of a pool.
 */
struct SwapEngine
{
    virtual ~SwapEngine() {}

    /**
     * @brief token held at slot @p index, or none past the last slot
     */
    virtual boost::optional<address_t> token_at(unsigned index) const = 0;

    /**
     * @brief aggregate parameters, primary shape. none if not supported
     */
    virtual boost::optional<SwapStorage> swap_storage() const = 0;

    /**
     * @brief aggregate parameters, guarded shape. none if not supported
     */
    virtual boost::optional<GuardedSwapStorage> guarded_swap_storage() const { return boost::none; }

    virtual address_t owner() const = 0;
    virtual bool paused() const = 0;
    virtual balance_t token_balance(unsigned index) const = 0;
    virtual balance_t virtual_price() const = 0;
    virtual balance_t a() const = 0;
};


/**
 * @brief Deposit front-end of a meta pool.
 *
 * It exposes the meta pool tokens with the base pool LP token
 * unwrapped into the base pool tokens.
 */
struct DepositWrapper
{
    virtual ~DepositWrapper() {}
    virtual boost::optional<address_t> token_at(unsigned index) const = 0;
    virtual address_t base_pool() const = 0;    ///< base pool swap address
    virtual address_t meta_swap() const = 0;    ///< meta pool this wrapper fronts
};


/**
 * @brief Resolves addresses to collaborators.
 */
struct ContractDirectory
{
    virtual ~ContractDirectory() {}

    /**
     * @return the swap engine deployed at @p address, or nullptr
     */
    virtual const SwapEngine *swap_engine(const address_t &address) const = 0;

    /**
     * @return the deposit wrapper deployed at @p address, or nullptr
     */
    virtual const DepositWrapper *deposit_wrapper(const address_t &address) const = 0;

    /**
     * @brief total supply of an (LP) token
     */
    virtual balance_t total_supply(const address_t &token) const = 0;

    /**
     * @brief same as swap_engine(), throws NoSuchContract instead of returning nullptr
     */
    const SwapEngine &require_swap_engine(const address_t &address) const;

    /**
     * @brief same as deposit_wrapper(), throws NoSuchContract instead of returning nullptr
     */
    const DepositWrapper &require_deposit_wrapper(const address_t &address) const;
};


/**
 * @brief In-memory ContractDirectory.
 *
 * Shares ownership of the registered collaborators.
 */
struct ContractBook: ContractDirectory, boost::noncopyable
{
    void add_swap_engine(const address_t &address, std::shared_ptr<const SwapEngine> engine);
    void add_deposit_wrapper(const address_t &address, std::shared_ptr<const DepositWrapper> wrapper);
    void set_total_supply(const address_t &token, const balance_t &supply);

    const SwapEngine *swap_engine(const address_t &address) const override;
    const DepositWrapper *deposit_wrapper(const address_t &address) const override;
    balance_t total_supply(const address_t &token) const override;

private:
    std::unordered_map<address_t, std::shared_ptr<const SwapEngine>>     m_engines;
    std::unordered_map<address_t, std::shared_ptr<const DepositWrapper>> m_wrappers;
    std::unordered_map<address_t, balance_t>                             m_supplies;
};


/**
 * @brief Bounded lazy sequence over the token slots of a contract.
 *
 * Slots are probed one at a time, starting from 0, only when next() is
 * called. The sequence ends at the first slot the contract does not
 * answer for, or at the cap, whichever comes first.
 *
 * A slot answering the null address is a broken contract: next() throws
 * ZeroToken.
 */
class TokenProbe
{
public:
    typedef std::function<boost::optional<address_t>(unsigned)> probe_fn;

    TokenProbe(probe_fn probe, unsigned cap, const address_t &contract);

    /**
     * @brief fetch the following slot
     * @return false once the sequence is exhausted. @p out is untouched then
     */
    bool next(address_t &out);

    unsigned position() const { return m_position; }

private:
    probe_fn  m_probe;
    unsigned  m_cap;
    unsigned  m_position = 0;
    bool      m_exhausted = false;
    address_t m_contract;
};


/**
 * @brief drain a TokenProbe over any contract exposing token_at()
 */
template<typename Contract>
address_list_t discover_tokens(const Contract &contract
                               , unsigned cap
                               , const address_t &contract_address)
{
    TokenProbe probe([&contract](unsigned i) { return contract.token_at(i); }
                     , cap
                     , contract_address);
    address_list_t res;
    address_t token;
    while (probe.next(token))
    {
        res.emplace_back(token);
    }
    return res;
}


/**
 * @brief read aggregate parameters, trying primary and guarded shape in this order
 * @throws NoParameterData if the engine supports neither
 */
SwapStorage fetch_swap_storage(const SwapEngine &engine, const address_t &engine_address);


} // namespace model
} // namespace poolreg
