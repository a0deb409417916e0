#include "test_utils.hpp"
#include <iostream>

using namespace poolreg::test;


void test_saddle_scenario()
{
    SaddleScenario s;
    auto registry = s.make_registry();

    check(registry->add_pool(s.manager, s.base_pool_input()) == 0, "base pool index");
    check(registry->add_pool(s.manager, s.meta_pool_input()) == 1, "meta pool index");
    check(registry->get_pools_length() == 2, "pools length");

    auto base = registry->get_pool_data(s.basePool);
    check(base.lpToken == s.baseLp, "base lp token");
    check(base.tokens == address_list_t({s.dai, s.usdc, s.usdt}), "base tokens");
    check(base.targetAddress == s.basePool, "null target defaults to the pool address");
    check(base.underlyingTokens.empty() && base.basePoolAddress.is_null(), "base has no underlying tokens");
    check(registry->get_pool_data_at_index(0) == base, "lookup by index");
    check(registry->get_pool_data_by_name("USD pool") == base, "lookup by name");

    auto meta = registry->get_pool_data(s.metaPool);
    check(meta.lpToken == s.metaLp, "meta lp token");
    check(meta.tokens == address_list_t({s.susd, s.baseLp}), "meta tokens");
    check(meta.underlyingTokens == address_list_t({s.susd, s.dai, s.usdc, s.usdt}), "meta underlying tokens");
    check(meta.basePoolAddress == s.basePool, "meta base pool");
    check(registry->get_tokens(s.metaPool) == meta.tokens, "get_tokens");
    check(registry->get_underlying_tokens(s.metaPool) == meta.underlyingTokens, "get_underlying_tokens");
    check(registry->get_all_pool_data() == std::vector<PoolData>({base, meta}), "all pool data");

    // base level pairs go through the base pool
    check(registry->get_eligible_pools(s.dai, s.usdc) == address_list_t({s.basePool}), "(dai, usdc)");
    check(registry->get_eligible_pools(s.usdt, s.dai) == address_list_t({s.basePool}), "(usdt, dai)");

    // underlying vs meta level tokens go through the wrapper
    check(registry->get_eligible_pools(s.susd, s.usdc) == address_list_t({s.metaWrapper}), "(susd, usdc)");
    check(registry->get_eligible_pools(s.usdc, s.susd) == address_list_t({s.metaWrapper}), "(usdc, susd)");
    check(registry->get_eligible_pools(s.dai, s.susd) == address_list_t({s.metaWrapper}), "(dai, susd)");

    // meta level pairs go through the meta pool
    check(registry->get_eligible_pools(s.baseLp, s.susd) == address_list_t({s.metaPool}), "(base lp, susd)");

    // an underlying token and the LP token wrapping it are not a pair
    check(registry->get_eligible_pools(s.dai, s.baseLp).empty(), "(dai, base lp)");
    check(registry->get_eligible_pools(s.dai, s.metaLp).empty(), "(dai, meta lp)");
}

void test_meta_before_base()
{
    SaddleScenario s;
    auto registry = s.make_registry();

    expect_throw<BasePoolNotFound>("meta pool first", [&]() {
        registry->add_pool(s.manager, s.meta_pool_input());
    });
    check(registry->get_pools_length() == 0, "nothing committed");
    check(registry->get_eligible_pools(s.susd, s.baseLp).empty(), "no pairs committed");

    registry->add_pool(s.manager, s.base_pool_input());
    check(registry->add_pool(s.manager, s.meta_pool_input()) == 1, "meta pool after base");
}

void test_invalid_pair()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    registry->add_pool(s.manager, s.base_pool_input());

    expect_throw<InvalidPair>("null from", [&]() { registry->get_eligible_pools(address_t(), s.dai); });
    expect_throw<InvalidPair>("from == to", [&]() { registry->get_eligible_pools(s.dai, s.dai); });
    check(registry->get_eligible_pools(s.dai, address_t()).empty(), "null to matches nothing");
}

void test_add_failures()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    registry->add_pool(s.manager, s.base_pool_input());

    auto input = s.base_pool_input();
    input.poolAddress = address_t();
    expect_throw<InvalidIdentifier>("null pool address", [&]() { registry->add_pool(s.manager, input); });

    input = s.base_pool_input();
    input.name = "another name";
    expect_throw<AlreadyRegistered>("same address", [&]() { registry->add_pool(s.manager, input); });

    input = s.meta_pool_input();
    input.name = "USD pool";
    expect_throw<NameAlreadyRegistered>("same name", [&]() { registry->add_pool(s.manager, input); });

    input.name = "";
    expect_throw<InvalidName>("empty name", [&]() { registry->add_pool(s.manager, input); });

    input.name = std::string(MAX_NAME_LENGTH + 1, 'x');
    expect_throw<InvalidName>("name too long", [&]() { registry->add_pool(s.manager, input); });

    input.name = std::string(MAX_NAME_LENGTH, 'x');
    input.poolAddress = make_address(0x999);
    input.depositWrapperAddress = address_t();
    expect_throw<NoSuchContract>("no engine deployed", [&]() { registry->add_pool(s.manager, input); });

    input = s.meta_pool_input();
    input.depositWrapperAddress = make_address(0x998);
    expect_throw<NoSuchContract>("no wrapper deployed", [&]() { registry->add_pool(s.manager, input); });

    expect_throw<OutOfBounds>("index past the end", [&]() { registry->get_pool_data_at_index(1); });
    expect_throw<PoolNotFound>("unknown pool", [&]() { registry->get_pool_data(s.metaPool); });
    expect_throw<PoolNotFound>("unknown name", [&]() { registry->get_pool_data_by_name("nope"); });
    expect_throw<PoolNotFound>("tokens of an unknown pool", [&]() { registry->get_tokens(s.metaPool); });

    check(registry->get_pools_length() == 1, "failures committed nothing");
}

void test_authorization()
{
    SaddleScenario s;
    auto registry = s.make_registry();

    expect_throw<AuthorizationError>("outsider", [&]() {
        registry->add_pool(s.outsider, s.base_pool_input());
    });
    expect_throw<AuthorizationError>("community manager, approved pool", [&]() {
        registry->add_pool(s.community, s.base_pool_input());
    });

    auto input = s.base_pool_input();
    input.isApproved = false;
    registry->add_pool(s.community, input);
    check(!registry->get_pool_data(s.basePool).isApproved, "community pool is unapproved");

    expect_throw<AuthorizationError>("community manager can't approve", [&]() {
        registry->approve_pool(s.community, s.basePool);
    });
    expect_throw<AuthorizationError>("community manager can't remove", [&]() {
        registry->remove_pool(s.community, s.basePool);
    });
    expect_throw<AuthorizationError>("community manager can't update", [&]() {
        registry->update_pool(s.community, registry->get_pool_data(s.basePool));
    });

    // only managers hand out the community manager role
    expect_throw<AuthorizationError>("admin is no manager of community managers", [&]() {
        registry->grant_role(s.community, COMMUNITY_MANAGER_ROLE, s.outsider);
    });
    check(registry->get_role_admin(COMMUNITY_MANAGER_ROLE) == SADDLE_MANAGER_ROLE, "community admin role");
}

void test_approve()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    auto input = s.base_pool_input();
    input.isApproved = false;
    registry->add_pool(s.manager, input);

    registry->approve_pool(s.manager, s.basePool);
    check(registry->get_pool_data(s.basePool).isApproved, "approved");

    s.baseEngine->owner_address = s.outsider;
    expect_throw<NotSaddleOwned>("foreign owner", [&]() { registry->approve_pool(s.manager, s.basePool); });
    expect_throw<PoolNotFound>("unknown pool", [&]() { registry->approve_pool(s.manager, s.metaPool); });
}

void test_remove_purges()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    registry->add_pool(s.manager, s.base_pool_input());

    registry->remove_pool(s.manager, s.basePool);
    check(registry->get_pools_length() == 1, "record stays");
    check(registry->get_pool_data_at_index(0).isRemoved, "flagged as removed");
    expect_throw<PoolNotFound>("removed pool by address", [&]() { registry->get_pool_data(s.basePool); });
    expect_throw<PoolNotFound>("removed pool by name", [&]() { registry->get_pool_data_by_name("USD pool"); });
    check(registry->get_eligible_pools(s.dai, s.usdc).empty(), "pairs withdrawn");
    expect_throw<PoolNotFound>("remove twice", [&]() { registry->remove_pool(s.manager, s.basePool); });

    // address and name can be registered again
    check(registry->add_pool(s.manager, s.base_pool_input()) == 1, "registered again");
    check(registry->get_pool_data(s.basePool) == registry->get_pool_data_at_index(1), "lookups point to the new record");
    check(registry->get_eligible_pools(s.dai, s.usdc) == address_list_t({s.basePool}), "pairs back");
}

void test_remove_flags_only()
{
    SaddleScenario s;
    RegistryConfig config;
    config.purge_removed_pools = false;
    auto registry = s.make_registry(config);
    registry->add_pool(s.manager, s.base_pool_input());

    registry->remove_pool(s.manager, s.basePool);
    check(registry->get_pool_data(s.basePool).isRemoved, "still visible, flagged");
    check(registry->get_eligible_pools(s.dai, s.usdc) == address_list_t({s.basePool}), "pairs untouched");
    expect_throw<AlreadyRegistered>("address still taken", [&]() {
        registry->add_pool(s.manager, s.base_pool_input());
    });
}

void test_update()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    registry->add_pool(s.manager, s.base_pool_input());
    registry->add_pool(s.manager, s.meta_pool_input());

    auto record = registry->get_pool_data(s.basePool);
    record.name = "renamed";
    record.externalId = 42;
    registry->update_pool(s.manager, record);

    check(registry->get_pool_data(s.basePool) == record, "updated");
    check(registry->get_pool_data_by_name("renamed").externalId == 42, "lookup by new name");
    expect_throw<PoolNotFound>("old name released", [&]() { registry->get_pool_data_by_name("USD pool"); });

    // same name again is fine
    registry->update_pool(s.manager, record);

    record.name = "SUSD meta pool";
    expect_throw<NameAlreadyRegistered>("name of another pool", [&]() { registry->update_pool(s.manager, record); });
    record.name = "";
    expect_throw<InvalidName>("empty name", [&]() { registry->update_pool(s.manager, record); });
    record.name = "renamed";
    record.poolAddress = make_address(0x999);
    expect_throw<PoolNotFound>("unknown pool", [&]() { registry->update_pool(s.manager, record); });
}

void test_update_cannot_remove()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    registry->add_pool(s.manager, s.base_pool_input());

    auto record = registry->get_pool_data(s.basePool);
    record.isRemoved = true;
    expect_throw<ValidationError>("removal through update", [&]() { registry->update_pool(s.manager, record); });

    check(!registry->get_pool_data(s.basePool).isRemoved, "record untouched");
    check(registry->get_eligible_pools(s.dai, s.usdc) == address_list_t({s.basePool}), "pairs untouched");

    // a removed record, still visible when not purging, stays removed
    RegistryConfig config;
    config.purge_removed_pools = false;
    auto flagging = s.make_registry(config);
    flagging->add_pool(s.manager, s.base_pool_input());
    flagging->remove_pool(s.manager, s.basePool);
    record = flagging->get_pool_data(s.basePool);
    record.name = "renamed";
    flagging->update_pool(s.manager, record);
    record.isRemoved = false;
    expect_throw<ValidationError>("restore through update", [&]() { flagging->update_pool(s.manager, record); });
    check(flagging->get_pool_data(s.basePool).isRemoved, "still removed");
}

void test_guarded_parameters()
{
    SaddleScenario s;
    auto registry = s.make_registry();

    GuardedSwapStorage guarded;
    guarded.swapFee = 1234;
    guarded.lpToken = s.baseLp;
    s.baseEngine->storage = boost::none;
    s.baseEngine->guarded = guarded;

    registry->add_pool(s.manager, s.base_pool_input());
    check(registry->get_pool_data(s.basePool).lpToken == s.baseLp, "lp token from the guarded shape");
    check(registry->get_swap_fee(s.basePool) == 1234, "swap fee from the guarded shape");
    check(registry->get_admin_fee(s.basePool) == 0, "no admin fee in the guarded shape");

    s.metaEngine->storage = boost::none;
    expect_throw<NoParameterData>("no parameters at all", [&]() {
        registry->add_pool(s.manager, s.meta_pool_input());
    });
    check(registry->get_pools_length() == 1, "nothing committed");
    check(registry->get_eligible_pools(s.susd, s.usdc).empty(), "no pairs committed");
}

void test_token_discovery()
{
    SaddleScenario s;
    auto registry = s.make_registry();

    s.baseEngine->tokens = {s.dai, address_t(), s.usdt};
    expect_throw<ZeroToken>("null token", [&]() { registry->add_pool(s.manager, s.base_pool_input()); });

    // an engine answering forever is cut at the cap
    s.baseEngine->tokens = {s.dai, s.usdc, s.usdt};
    s.baseEngine->answers_past_end = true;
    s.baseEngine->probes = 0;
    registry->add_pool(s.manager, s.base_pool_input());
    check(registry->get_tokens(s.basePool).size() == MAX_POOL_TOKENS, "token cap");
    check(s.baseEngine->probes == MAX_POOL_TOKENS, "no probe past the cap");

    // repeated tokens make no self pair
    check(registry->get_eligible_pools(s.dai, s.usdc) == address_list_t({s.basePool}), "repeated tokens");

    RegistryConfig config;
    config.max_tokens = 2;
    auto small = s.make_registry(config);
    small->add_pool(s.manager, s.base_pool_input());
    check(small->get_tokens(s.basePool) == address_list_t({s.dai, s.usdc}), "configured cap");
    check(small->get_eligible_pools(s.dai, s.usdt).empty(), "tokens past the cap are ignored");
}

void test_reentrancy()
{
    SaddleScenario s;
    auto registry = s.make_registry();

    std::size_t seen_length = 99;
    s.baseEngine->on_probe = [&](unsigned) {
        seen_length = registry->get_pools_length();
        registry->add_pool(s.manager, s.meta_pool_input());
    };
    expect_throw<ReentrancyError>("write from a probe", [&]() {
        registry->add_pool(s.manager, s.base_pool_input());
    });
    check(seen_length == 0, "reads are fine during a write");
    check(registry->get_pools_length() == 0, "nothing committed");

    s.baseEngine->on_probe = nullptr;
    check(registry->add_pool(s.manager, s.base_pool_input()) == 0, "write guard released");
}

void test_wrapper_mismatch()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    registry->add_pool(s.manager, s.base_pool_input());

    s.wrapper->meta = make_address(0x777);
    expect_throw<WrapperMismatch>("wrapper fronting another pool", [&]() {
        registry->add_pool(s.manager, s.meta_pool_input());
    });
    check(registry->get_pools_length() == 1, "nothing committed");
    check(registry->get_eligible_pools(s.susd, s.usdc).empty(), "no wrapper pairs committed");
    check(registry->get_eligible_pools(s.susd, s.baseLp).empty(), "no pool pairs committed");
}

void test_balances()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    registry->add_pool(s.manager, s.base_pool_input());
    registry->add_pool(s.manager, s.meta_pool_input());

    s.baseEngine->balances = {100, 200, 300};
    s.metaEngine->balances = {50, 30};
    s.book.set_total_supply(s.baseLp, 60);

    auto meta = registry->get_token_balances(s.metaPool);
    check(meta.tokens == address_list_t({s.susd, s.baseLp}), "meta balance tokens");
    check(meta.balances == std::vector<balance_t>({50, 30}), "meta balances");

    // the meta pool holds half the base LP supply
    auto underlying = registry->get_underlying_token_balances(s.metaPool);
    check(underlying.tokens == address_list_t({s.susd, s.dai, s.usdc, s.usdt}), "underlying balance tokens");
    check(underlying.balances == std::vector<balance_t>({50, 50, 100, 150}), "underlying balances");

    auto base = registry->get_underlying_token_balances(s.basePool);
    check(base.balances == std::vector<balance_t>({100, 200, 300}), "plain pool underlying balances");

    // huge figures don't overflow the intermediate product
    const balance_t huge("0x8000000000000000000000000000000000000000000000000000000000000000");
    s.baseEngine->balances = {huge, 0, 0};
    s.metaEngine->balances = {0, huge};
    s.book.set_total_supply(s.baseLp, huge);
    check(registry->get_underlying_token_balances(s.metaPool).balances[1] == huge, "wide product");

    s.book.set_total_supply(s.baseLp, 0);
    underlying = registry->get_underlying_token_balances(s.metaPool);
    check(underlying.balances == std::vector<balance_t>({0, 0, 0, 0}), "empty base LP supply");
}

void test_live_reads()
{
    SaddleScenario s;
    auto registry = s.make_registry();

    // a pool record whose engine lives elsewhere
    auto input = s.base_pool_input();
    input.poolAddress = make_address(0x300);
    input.targetAddress = s.basePool;
    registry->add_pool(s.manager, input);

    s.baseEngine->is_paused = true;
    s.baseEngine->vprice = 1001;
    s.baseEngine->amplification = 400;
    s.baseEngine->storage->adminFee = 5;

    check(registry->get_paused(input.poolAddress), "paused");
    check(registry->get_virtual_price(input.poolAddress) == 1001, "virtual price");
    check(registry->get_a(input.poolAddress) == 400, "A");
    check(registry->get_swap_fee(input.poolAddress) == 4000000, "swap fee");
    check(registry->get_admin_fee(input.poolAddress) == 5, "admin fee");
    check(registry->get_swap_storage(input.poolAddress).lpToken == s.baseLp, "swap storage");
    check(registry->get_eligible_pools(s.dai, s.usdc) == address_list_t({input.poolAddress}), "pool address is the venue");
    expect_throw<PoolNotFound>("unregistered engine address", [&]() { registry->get_paused(s.basePool); });
}


struct RecordingListener: RegistryListener
{
    std::vector<std::string> events;
    bool fail = false;

    void pool_added(const address_t &poolAddress, std::size_t index, const PoolData &) override
    {
        events.emplace_back("added " + poolAddress.str() + " " + std::to_string(index));
        if (fail) throw std::runtime_error("listener failure");
    }
    void pool_approved(const address_t &poolAddress) override { events.emplace_back("approved " + poolAddress.str()); }
    void pool_updated(const PoolData &record) override        { events.emplace_back("updated " + record.name); }
    void pool_removed(const address_t &poolAddress) override  { events.emplace_back("removed " + poolAddress.str()); }
};

void test_listener()
{
    SaddleScenario s;
    auto registry = s.make_registry();
    RecordingListener listener;
    registry->set_listener(&listener);

    registry->add_pool(s.manager, s.base_pool_input());
    registry->approve_pool(s.manager, s.basePool);
    auto record = registry->get_pool_data(s.basePool);
    record.name = "renamed";
    registry->update_pool(s.manager, record);
    registry->remove_pool(s.manager, s.basePool);

    const std::vector<std::string> expected{
        "added " + s.basePool.str() + " 0",
        "approved " + s.basePool.str(),
        "updated renamed",
        "removed " + s.basePool.str(),
    };
    check(listener.events == expected, "listener events");

    // a failing listener does not undo the write
    listener.fail = true;
    registry->add_pool(s.manager, s.base_pool_input());
    check(registry->get_pools_length() == 2, "write survives a listener failure");
}


int main()
{
    test_saddle_scenario();
    test_meta_before_base();
    test_invalid_pair();
    test_add_failures();
    test_authorization();
    test_approve();
    test_remove_purges();
    test_remove_flags_only();
    test_update();
    test_update_cannot_remove();
    test_guarded_parameters();
    test_token_discovery();
    test_reentrancy();
    test_wrapper_mismatch();
    test_balances();
    test_live_reads();
    test_listener();
    std::cout << "pool registry: all good" << std::endl;
}
