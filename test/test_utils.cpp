#include "test_utils.hpp"

namespace poolreg {
namespace test {


address_t make_address(unsigned int n)
{
    return address_t(address_t::base_type(n));
}

void check(bool cond, const std::string &what)
{
    if (!cond)
    {
        throw std::runtime_error(what);
    }
}


ScriptedSwapEngine::ref ScriptedSwapEngine::make(const address_list_t &tokens, const address_t &lpToken)
{
    auto res = std::make_shared<ScriptedSwapEngine>();
    res->tokens = tokens;
    res->balances.assign(tokens.size(), balance_t(0));
    SwapStorage storage;
    storage.initialA = 200;
    storage.futureA = 200;
    storage.swapFee = 4000000;
    storage.adminFee = 0;
    storage.lpToken = lpToken;
    res->storage = storage;
    res->vprice = balance_t("1000000000000000000");
    res->amplification = 200;
    return res;
}

boost::optional<address_t> ScriptedSwapEngine::token_at(unsigned index) const
{
    ++probes;
    if (on_probe)
    {
        on_probe(index);
    }
    if (answers_past_end && !tokens.empty())
    {
        return tokens[index % tokens.size()];
    }
    if (index >= tokens.size())
    {
        return boost::none;
    }
    return tokens[index];
}

balance_t ScriptedSwapEngine::token_balance(unsigned index) const
{
    return index < balances.size() ? balances[index] : balance_t(0);
}


ScriptedDepositWrapper::ref ScriptedDepositWrapper::make(const address_list_t &tokens
                                                         , const address_t &base
                                                         , const address_t &meta)
{
    auto res = std::make_shared<ScriptedDepositWrapper>();
    res->tokens = tokens;
    res->base = base;
    res->meta = meta;
    return res;
}

boost::optional<address_t> ScriptedDepositWrapper::token_at(unsigned index) const
{
    if (index >= tokens.size())
    {
        return boost::none;
    }
    return tokens[index];
}


SaddleScenario::SaddleScenario()
{
    baseEngine = ScriptedSwapEngine::make({dai, usdc, usdt}, baseLp);
    baseEngine->owner_address = poolOwner;
    metaEngine = ScriptedSwapEngine::make({susd, baseLp}, metaLp);
    metaEngine->owner_address = poolOwner;
    wrapper = ScriptedDepositWrapper::make({susd, dai, usdc, usdt}, basePool, metaPool);

    book.add_swap_engine(basePool, baseEngine);
    book.add_swap_engine(metaPool, metaEngine);
    book.add_deposit_wrapper(metaWrapper, wrapper);
}

std::unique_ptr<PoolRegistry> SaddleScenario::make_registry(const RegistryConfig &config) const
{
    std::unique_ptr<PoolRegistry> res(new PoolRegistry(book, admin, poolOwner, config));
    res->grant_role(admin, SADDLE_MANAGER_ROLE, manager);
    res->grant_role(manager, COMMUNITY_MANAGER_ROLE, community);
    return res;
}

PoolInputData SaddleScenario::base_pool_input() const
{
    PoolInputData res;
    res.poolAddress = basePool;
    res.assetClass = ASSET_USD;
    res.name = "USD pool";
    res.isApproved = true;
    return res;
}

PoolInputData SaddleScenario::meta_pool_input() const
{
    PoolInputData res;
    res.poolAddress = metaPool;
    res.assetClass = ASSET_USD;
    res.name = "SUSD meta pool";
    res.depositWrapperAddress = metaWrapper;
    res.isApproved = true;
    return res;
}


} // namespace test
} // namespace poolreg
