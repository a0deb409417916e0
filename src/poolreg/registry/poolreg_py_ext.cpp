#pragma GCC diagnostic ignored "-Wdeprecated-declarations" // Silencing GCC nagging me about std::auto_ptr somewhere in boost legacy snippets

#include <boost/python.hpp>
#include <sstream>
#include "longobject.h"
#include "unicodeobject.h"
#include "pool_registry.hpp"
#include "master_registry.hpp"
#include "../model/poolreg_errors.hpp"
#include "../commons/poolreg_log.hpp"



using namespace boost::python;
using namespace poolreg::model;
using namespace poolreg::registry;


/**
 * @brief Pops the pending Python exception and renders it as a string.
 *
 * The Python error indicator is cleared.
 */
static std::string py_error_string()
{
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    handle<> htype(allow_null(type));
    handle<> hvalue(allow_null(value));
    handle<> htraceback(allow_null(traceback));

    std::string res("unknown Python error");
    if (hvalue)
    {
        handle<> repr(allow_null(PyObject_Str(hvalue.get())));
        if (repr)
        {
            const char *utf8 = PyUnicode_AsUTF8(repr.get());
            if (utf8 != nullptr) res = utf8;
        }
    }
    PyErr_Clear();
    return res;
}


/**
 * @brief get_override() of a method the Python subclass does not define
 *        leaves an AttributeError behind. Drop it.
 */
static void clear_missing_override()
{
    if (PyErr_Occurred() && PyErr_ExceptionMatches(PyExc_AttributeError))
    {
        PyErr_Clear();
    }
}


/**
 * @brief utf-8 text of a str or bytes object, or of its str() rendition
 */
static std::string py_text(PyObject *vv)
{
    if (PyBytes_Check(vv))
    {
        return std::string(PyBytes_AsString(vv));
    }
    handle<> str_repr(PyObject_Str(vv));
    const char *utf8 = PyUnicode_AsUTF8(str_repr.get());
    if (utf8 == nullptr) throw_error_already_set();
    return std::string(utf8);
}


/**
 * @brief PyLong_AsBalance
 *
 * Translate a CPython bigint (or its decimal / 0x-hex string) into a
 * boost::multiprecision bigint (balance_t).
 */
static balance_t PyLong_AsBalance(PyObject *vv)
{
    // TODO: avoid using string parsing. Perform more efficient bit banging translation.
    std::string repr = py_text(vv);
    try {
        return balance_t(repr.c_str());
    }
    catch (const std::exception &) {
        PyErr_SetString(PyExc_ValueError, strfmt("bad uint representation: %1%", repr).c_str());
        throw_error_already_set();
    }
    return 0;
}


/**
 * @brief Translate a Python int, 0x-hex str or bytes into an address_t.
 *
 * Negative ints and anything wider than 160 bits raise ValueError.
 */
static address_t PyObject_AsAddress(PyObject *vv)
{
    std::string repr;
    if (PyLong_Check(vv))
    {
        handle<> hex(PyNumber_ToBase(vv, 16));
        repr = py_text(hex.get());
    }
    else {
        repr = py_text(vv);
    }

    try {
        return address_t(repr.c_str());
    }
    catch (const std::exception &) {
        PyErr_SetString(PyExc_ValueError, strfmt("bad address representation: %1%", repr).c_str());
        throw_error_already_set();
    }
    return address_t();
}


/**
 * @brief Translator which executes transparent translation of Python unbounded "int" into
 *        balance_t objects, which are very big numbers, much larger than
 *        the largest CPU registry.
 */
struct balance_from_python_long
{
    balance_from_python_long()
    {
        converter::registry::push_back(
                    &convertible,
                    &construct,
                    boost::python::type_id<balance_t>());
    }

    // Determine if obj_ptr can be converted
    static void* convertible(PyObject* obj_ptr)
    {
        if (PyLong_Check(obj_ptr) ||
                PyUnicode_Check(obj_ptr) ||
                PyBytes_Check(obj_ptr)
                ) return obj_ptr;
        return 0;
    }

    static void construct(
        PyObject* obj_ptr,
        converter::rvalue_from_python_stage1_data* data)
    {
        balance_t value = PyLong_AsBalance(obj_ptr);

        // Grab pointer to memory into which to construct the new value
        balance_t* storage = reinterpret_cast<balance_t*>(((converter::rvalue_from_python_storage<balance_t>*)data)->storage.bytes);
        new (storage) balance_t(value);

        // Stash the memory chunk pointer for later use by boost.python
        data->convertible = storage;
    }
};


struct balance_to_python_long
{
    static PyObject* convert(balance_t const& o)
    {
        std::stringstream ss;
        ss << o;
        return PyLong_FromString(ss.str().c_str(), nullptr, 10);
    }
};


/**
 * @brief addresses travel to Python as lowercase 0x hexstrings,
 *        and come back from hexstrings or ints
 */
struct address_from_python
{
    address_from_python()
    {
        converter::registry::push_back(
                    &convertible,
                    &construct,
                    boost::python::type_id<address_t>());
    }

    static void* convertible(PyObject* obj_ptr)
    {
        if (PyLong_Check(obj_ptr) ||
                PyUnicode_Check(obj_ptr) ||
                PyBytes_Check(obj_ptr)
                ) return obj_ptr;
        return 0;
    }

    static void construct(
        PyObject* obj_ptr,
        converter::rvalue_from_python_stage1_data* data)
    {
        address_t value = PyObject_AsAddress(obj_ptr);
        address_t* storage = reinterpret_cast<address_t*>(((converter::rvalue_from_python_storage<address_t>*)data)->storage.bytes);
        new (storage) address_t(value);
        data->convertible = storage;
    }
};


struct address_to_python_str
{
    static PyObject* convert(address_t const& o)
    {
        return incref(object(o.str()).ptr());
    }
};


template<typename Vector>
struct vector_to_python_list
{
    static PyObject* convert(Vector const& v)
    {
        list res;
        for (const auto &item: v)
        {
            res.append(item);
        }
        return incref(res.ptr());
    }
};


static address_list_t address_list_from_python(const object &items)
{
    address_list_t res;
    stl_input_iterator<address_t> begin(items), end;
    res.assign(begin, end);
    return res;
}


/**
 * @brief Python subclassable SwapEngine.
 *
 * Subclasses implement token_at(i), swap_storage(), owner(), paused(),
 * token_balance(i), virtual_price(), a(), and optionally
 * guarded_swap_storage(). Optional answers are given as None.
 *
 * A token_at() that raises reads as "no token at this slot", the same
 * way a reverted on-chain probe does. Likewise a raising swap_storage()
 * or guarded_swap_storage() reads as "shape not supported".
 */
struct SwapEngineWrap: SwapEngine, wrapper<SwapEngine>
{
    boost::optional<address_t> token_at(unsigned index) const override
    {
        try {
            object res = this->get_override("token_at")(index);
            if (res.is_none()) return boost::none;
            return extract<address_t>(res)();
        }
        catch (const error_already_set &) {
            const std::string err = py_error_string();
            log_debug("token_at(%1%) raised, end of tokens: %2%", index, err);
        }
        return boost::none;
    }

    boost::optional<SwapStorage> swap_storage() const override
    {
        try {
            object res = this->get_override("swap_storage")();
            if (res.is_none()) return boost::none;
            return extract<SwapStorage>(res)();
        }
        catch (const error_already_set &) {
            const std::string err = py_error_string();
            log_debug("swap_storage() raised, primary shape unavailable: %1%", err);
        }
        return boost::none;
    }

    boost::optional<GuardedSwapStorage> guarded_swap_storage() const override
    {
        override f = this->get_override("guarded_swap_storage");
        clear_missing_override();
        if (!f)
        {
            return SwapEngine::guarded_swap_storage();
        }
        try {
            object res = f();
            if (res.is_none()) return boost::none;
            return extract<GuardedSwapStorage>(res)();
        }
        catch (const error_already_set &) {
            const std::string err = py_error_string();
            log_debug("guarded_swap_storage() raised, guarded shape unavailable: %1%", err);
        }
        return boost::none;
    }

    address_t owner() const override
    {
        return this->get_override("owner")();
    }

    bool paused() const override
    {
        return this->get_override("paused")();
    }

    balance_t token_balance(unsigned index) const override
    {
        return this->get_override("token_balance")(index);
    }

    balance_t virtual_price() const override
    {
        return this->get_override("virtual_price")();
    }

    balance_t a() const override
    {
        return this->get_override("a")();
    }
};


struct DepositWrapperWrap: DepositWrapper, wrapper<DepositWrapper>
{
    boost::optional<address_t> token_at(unsigned index) const override
    {
        try {
            object res = this->get_override("token_at")(index);
            if (res.is_none()) return boost::none;
            return extract<address_t>(res)();
        }
        catch (const error_already_set &) {
            const std::string err = py_error_string();
            log_debug("wrapper token_at(%1%) raised, end of tokens: %2%", index, err);
        }
        return boost::none;
    }

    address_t base_pool() const override
    {
        return this->get_override("base_pool")();
    }

    address_t meta_swap() const override
    {
        return this->get_override("meta_swap")();
    }
};


/**
 * @brief Python subclassable RegistryListener. Missing methods are no-ops.
 *
 * Exceptions raised by the Python side are logged, they never fail the
 * registry write that triggered the notification.
 */
struct RegistryListenerWrap: RegistryListener, wrapper<RegistryListener>
{
    void pool_added(const address_t &poolAddress, std::size_t index, const PoolData &record) override
    {
        override f = this->get_override("pool_added");
        clear_missing_override();
        if (f)
            m_guarded_call("pool_added", [&]() { f(poolAddress, index, record); });
    }

    void pool_approved(const address_t &poolAddress) override
    {
        override f = this->get_override("pool_approved");
        clear_missing_override();
        if (f)
            m_guarded_call("pool_approved", [&]() { f(poolAddress); });
    }

    void pool_updated(const PoolData &record) override
    {
        override f = this->get_override("pool_updated");
        clear_missing_override();
        if (f)
            m_guarded_call("pool_updated", [&]() { f(record); });
    }

    void pool_removed(const address_t &poolAddress) override
    {
        override f = this->get_override("pool_removed");
        clear_missing_override();
        if (f)
            m_guarded_call("pool_removed", [&]() { f(poolAddress); });
    }

    void registry_added(const std::string &name, const address_t &address, std::size_t version) override
    {
        override f = this->get_override("registry_added");
        clear_missing_override();
        if (f)
            m_guarded_call("registry_added", [&]() { f(name, address, version); });
    }

private:
    template<typename Fn>
    static void m_guarded_call(const char *event, Fn &&fn)
    {
        try {
            fn();
        }
        catch (const error_already_set &) {
            const std::string err = py_error_string();
            log_error("Python listener failed on %1%: %2%", event, err);
        }
    }
};


/**
 * @brief shared_ptr deleter pinning the Python object that owns the pointee
 */
struct py_keepalive
{
    object owner;
    void operator()(const void *) { owner = object(); }
};

static void book_add_swap_engine(ContractBook &book, const address_t &address, object engine)
{
    const SwapEngine &e = extract<SwapEngine &>(engine)();
    book.add_swap_engine(address, std::shared_ptr<const SwapEngine>(&e, py_keepalive{engine}));
}

static void book_add_deposit_wrapper(ContractBook &book, const address_t &address, object wrapper)
{
    const DepositWrapper &w = extract<DepositWrapper &>(wrapper)();
    book.add_deposit_wrapper(address, std::shared_ptr<const DepositWrapper>(&w, py_keepalive{wrapper}));
}


static void py_log_register_sink(object callable)
{
    if (callable.is_none())
    {
        log_register_sink(log_sink_t());
        return;
    }
    log_register_sink([callable](log_level lvl, const std::string &msg) {
        try {
            callable(lvl, msg);
        }
        catch (const error_already_set &) {
            PyErr_Print();
        }
    });
}


/**
 * @brief Registry failures surface as the closest Python builtin exception.
 */
static void translate_registry_error(const RegistryError &e)
{
    PyObject *type = PyExc_RuntimeError;
    if (dynamic_cast<const NotFoundError *>(&e) != nullptr)
        type = PyExc_KeyError;
    else if (dynamic_cast<const ValidationError *>(&e) != nullptr ||
             dynamic_cast<const ConflictError *>(&e) != nullptr ||
             dynamic_cast<const ConfigError *>(&e) != nullptr)
        type = PyExc_ValueError;
    else if (dynamic_cast<const AuthorizationError *>(&e) != nullptr)
        type = PyExc_PermissionError;
    PyErr_SetString(type, e.what());
}


static list pool_data_tokens(const PoolData &o)                 { return list(o.tokens); }
static list pool_data_underlying_tokens(const PoolData &o)      { return list(o.underlyingTokens); }
static void pool_data_set_tokens(PoolData &o, object v)         { o.tokens = address_list_from_python(v); }
static void pool_data_set_underlying_tokens(PoolData &o, object v) { o.underlyingTokens = address_list_from_python(v); }
static list token_balances_tokens(const TokenBalances &o)       { return list(o.tokens); }
static list token_balances_balances(const TokenBalances &o)     { return list(o.balances); }


/**
 * @brief Export C++ registries to Python.
 *
 * This is what is seen by "import" of this CPython extension.
 */
BOOST_PYTHON_MODULE(poolreg_ext)
{
    using dont_make_copies = boost::noncopyable;
    using by_value = return_value_policy<return_by_value>; // address_t and balance_t are converted, not wrapped

    to_python_converter<balance_t, balance_to_python_long>();
    balance_from_python_long();
    to_python_converter<address_t, address_to_python_str>();
    address_from_python();
    to_python_converter<address_list_t, vector_to_python_list<address_list_t>>();
    to_python_converter<std::vector<balance_t>, vector_to_python_list<std::vector<balance_t>>>();
    to_python_converter<std::vector<PoolData>, vector_to_python_list<std::vector<PoolData>>>();

    register_exception_translator<RegistryError>(&translate_registry_error);

    enum_<AssetClass_e>("AssetClass")
            .value("BTC"  , ASSET_BTC  )
            .value("ETH"  , ASSET_ETH  )
            .value("USD"  , ASSET_USD  )
            .value("OTHER", ASSET_OTHER)
            ;

    enum_<PairKeyScheme_e>("PairKeyScheme")
            .value("ORDERED", PAIR_KEY_ORDERED)
            .value("XOR"    , PAIR_KEY_XOR    )
            ;

    scope().attr("MAX_POOL_TOKENS") = MAX_POOL_TOKENS;
    scope().attr("MAX_NAME_LENGTH") = MAX_NAME_LENGTH;
    scope().attr("DEFAULT_ADMIN_ROLE") = DEFAULT_ADMIN_ROLE;
    scope().attr("SADDLE_MANAGER_ROLE") = SADDLE_MANAGER_ROLE;
    scope().attr("COMMUNITY_MANAGER_ROLE") = COMMUNITY_MANAGER_ROLE;
    scope().attr("SADDLE_APPROVED_POOL_OWNER_ROLE") = SADDLE_APPROVED_POOL_OWNER_ROLE;

    class_<RegistryConfig>("RegistryConfig")
            .def_readwrite("max_tokens"           , &RegistryConfig::max_tokens)
            .def_readwrite("max_name_length"      , &RegistryConfig::max_name_length)
            .def_readwrite("pair_key_scheme"      , &RegistryConfig::pair_key_scheme)
            .def_readwrite("purge_removed_pools"  , &RegistryConfig::purge_removed_pools)
            .def("check_consistency"              , &RegistryConfig::check_consistency)
            ;

    class_<SwapStorage>("SwapStorage")
            .add_property("initialA", make_getter(&SwapStorage::initialA, by_value()), make_setter(&SwapStorage::initialA))
            .add_property("futureA", make_getter(&SwapStorage::futureA, by_value()), make_setter(&SwapStorage::futureA))
            .def_readwrite("initialATime", &SwapStorage::initialATime)
            .def_readwrite("futureATime" , &SwapStorage::futureATime)
            .add_property("swapFee", make_getter(&SwapStorage::swapFee, by_value()), make_setter(&SwapStorage::swapFee))
            .add_property("adminFee", make_getter(&SwapStorage::adminFee, by_value()), make_setter(&SwapStorage::adminFee))
            .add_property("lpToken", make_getter(&SwapStorage::lpToken, by_value()), make_setter(&SwapStorage::lpToken))
            ;

    class_<GuardedSwapStorage>("GuardedSwapStorage")
            .add_property("initialA", make_getter(&GuardedSwapStorage::initialA, by_value()), make_setter(&GuardedSwapStorage::initialA))
            .add_property("futureA", make_getter(&GuardedSwapStorage::futureA, by_value()), make_setter(&GuardedSwapStorage::futureA))
            .def_readwrite("initialATime", &GuardedSwapStorage::initialATime)
            .def_readwrite("futureATime" , &GuardedSwapStorage::futureATime)
            .add_property("swapFee", make_getter(&GuardedSwapStorage::swapFee, by_value()), make_setter(&GuardedSwapStorage::swapFee))
            .add_property("lpToken", make_getter(&GuardedSwapStorage::lpToken, by_value()), make_setter(&GuardedSwapStorage::lpToken))
            ;

    class_<PoolInputData>("PoolInputData")
            .add_property("poolAddress", make_getter(&PoolInputData::poolAddress, by_value()), make_setter(&PoolInputData::poolAddress))
            .def_readwrite("assetClass"  , &PoolInputData::assetClass)
            .def_readwrite("name"        , &PoolInputData::name)
            .add_property("targetAddress", make_getter(&PoolInputData::targetAddress, by_value()), make_setter(&PoolInputData::targetAddress))
            .add_property("depositWrapperAddress", make_getter(&PoolInputData::depositWrapperAddress, by_value()), make_setter(&PoolInputData::depositWrapperAddress))
            .def_readwrite("externalId"  , &PoolInputData::externalId)
            .def_readwrite("isApproved"  , &PoolInputData::isApproved)
            .def_readwrite("isRemoved"   , &PoolInputData::isRemoved)
            ;

    class_<PoolData>("PoolData")
            .add_property("poolAddress", make_getter(&PoolData::poolAddress, by_value()), make_setter(&PoolData::poolAddress))
            .add_property("lpToken", make_getter(&PoolData::lpToken, by_value()), make_setter(&PoolData::lpToken))
            .def_readwrite("assetClass"  , &PoolData::assetClass)
            .def_readwrite("name"        , &PoolData::name)
            .add_property("targetAddress", make_getter(&PoolData::targetAddress, by_value()), make_setter(&PoolData::targetAddress))
            .add_property("tokens"           , &pool_data_tokens           , &pool_data_set_tokens)
            .add_property("underlyingTokens" , &pool_data_underlying_tokens, &pool_data_set_underlying_tokens)
            .add_property("basePoolAddress", make_getter(&PoolData::basePoolAddress, by_value()), make_setter(&PoolData::basePoolAddress))
            .add_property("depositWrapperAddress", make_getter(&PoolData::depositWrapperAddress, by_value()), make_setter(&PoolData::depositWrapperAddress))
            .def_readwrite("externalId"  , &PoolData::externalId)
            .def_readwrite("isApproved"  , &PoolData::isApproved)
            .def_readwrite("isRemoved"   , &PoolData::isRemoved)
            .def(self_ns::self == self_ns::self)
            .def(self_ns::self != self_ns::self)
            .def(self_ns::str(self_ns::self))
            ;

    class_<TokenBalances>("TokenBalances")
            .add_property("tokens"  , &token_balances_tokens)
            .add_property("balances", &token_balances_balances)
            ;

    class_<RegistryData>("RegistryData")
            .def_readonly("name"     , &RegistryData::name)
            .def_readonly("version"  , &RegistryData::version)
            .def_readonly("isLatest" , &RegistryData::isLatest)
            .def(self_ns::self == self_ns::self)
            ;

    class_<SwapEngineWrap, dont_make_copies>("SwapEngine");
    class_<DepositWrapperWrap, dont_make_copies>("DepositWrapper");
    class_<RegistryListenerWrap, dont_make_copies>("RegistryListener");

    class_<ContractDirectory, dont_make_copies>("ContractDirectory", no_init)
            .def("total_supply", &ContractDirectory::total_supply)
            ;

    class_<ContractBook, bases<ContractDirectory>, dont_make_copies>("ContractBook")
            .def("add_swap_engine"     , &book_add_swap_engine)
            .def("add_deposit_wrapper" , &book_add_deposit_wrapper)
            .def("set_total_supply"    , &ContractBook::set_total_supply)
            ;

    class_<AccessControl, dont_make_copies>("AccessControl", no_init)
            .def("has_role"          , &AccessControl::has_role)
            .def("get_role_admin"    , &AccessControl::get_role_admin)
            .def("grant_role"        , &AccessControl::grant_role)
            .def("revoke_role"       , &AccessControl::revoke_role)
            .def("renounce_role"     , &AccessControl::renounce_role)
            .def("role_member_count" , &AccessControl::role_member_count)
            ;

    class_<PoolRegistry, bases<AccessControl>, dont_make_copies>("PoolRegistry"
            , init<const ContractDirectory &, const address_t &, const address_t &>()[with_custodian_and_ward<1, 2>()])
            .def(init<const ContractDirectory &, const address_t &, const address_t &, const RegistryConfig &>()[with_custodian_and_ward<1, 2>()])
            .def("add_pool"                      , &PoolRegistry::add_pool)
            .def("approve_pool"                  , &PoolRegistry::approve_pool)
            .def("update_pool"                   , &PoolRegistry::update_pool)
            .def("remove_pool"                   , &PoolRegistry::remove_pool)
            .def("get_pool_data"                 , &PoolRegistry::get_pool_data)
            .def("get_pool_data_at_index"        , &PoolRegistry::get_pool_data_at_index)
            .def("get_pool_data_by_name"         , &PoolRegistry::get_pool_data_by_name)
            .def("get_all_pool_data"             , &PoolRegistry::get_all_pool_data)
            .def("get_pools_length"              , &PoolRegistry::get_pools_length)
            .def("get_tokens"                    , &PoolRegistry::get_tokens)
            .def("get_underlying_tokens"         , &PoolRegistry::get_underlying_tokens)
            .def("get_eligible_pools"            , &PoolRegistry::get_eligible_pools)
            .def("get_token_balances"            , &PoolRegistry::get_token_balances)
            .def("get_underlying_token_balances" , &PoolRegistry::get_underlying_token_balances)
            .def("get_virtual_price"             , &PoolRegistry::get_virtual_price)
            .def("get_a"                         , &PoolRegistry::get_a)
            .def("get_paused"                    , &PoolRegistry::get_paused)
            .def("get_swap_fee"                  , &PoolRegistry::get_swap_fee)
            .def("get_admin_fee"                 , &PoolRegistry::get_admin_fee)
            .def("get_swap_storage"              , &PoolRegistry::get_swap_storage)
            .def("set_listener"                  , &PoolRegistry::set_listener, with_custodian_and_ward<1, 2>())
            ;

    class_<MasterRegistry, bases<AccessControl>, dont_make_copies>("MasterRegistry", init<const address_t &>())
            .def(init<const address_t &, const RegistryConfig &>())
            .def("add_registry"                        , &MasterRegistry::add_registry)
            .def("resolve_name_to_latest_address"      , &MasterRegistry::resolve_name_to_latest_address)
            .def("resolve_name_and_version_to_address" , &MasterRegistry::resolve_name_and_version_to_address)
            .def("resolve_name_to_all_addresses"       , &MasterRegistry::resolve_name_to_all_addresses)
            .def("resolve_address_to_registry_data"    , &MasterRegistry::resolve_address_to_registry_data)
            .def("names_count"                         , &MasterRegistry::names_count)
            .def("set_listener"                        , &MasterRegistry::set_listener, with_custodian_and_ward<1, 2>())
            ;

    enum_<log_level>("log_level")
            .value("trace"  , log_level_trace  )
            .value("debug"  , log_level_debug  )
            .value("info"   , log_level_info   )
            .value("warning", log_level_warning)
            .value("error"  , log_level_error  )
            .export_values()
            ;
    def("log_get_level", log_get_level);
    def("log_set_level", log_set_level);
    def("log_register_sink", py_log_register_sink);
}
