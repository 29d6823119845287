#pragma GCC diagnostic ignored "-Wdeprecated-declarations" // Silencing GCC nagging me about std::auto_ptr somewhere in boost legacy snippets

#include <boost/python.hpp>
#include <sstream>
#include "longobject.h"
#include "unicodeobject.h"
#include <ammr/ledger/ammr_deployment.hpp>
#include <ammr/model/ammr_invariant.hpp>
#include <ammr/commons/ammr_log.hpp>



using namespace boost::python;
using namespace ammr::model;
using namespace ammr::router;
using namespace ammr::ledger;



/**
 * @brief PyLong_AsBalance
 *
 * Translate a CPython bigint into a boost::multiprecision bigint (balance_t).
 *
 * Used to provide transparent translation from Python to C++ data.
 * Negative or oversized values set a Python ValueError.
 */
static balance_t PyLong_AsBalance(PyObject *vv)
{
    // it's complicated to efficiently transpose Python's internal bigint representation
    // into boost::multiprecision bigint object limbs. Using string serialization
    // and lexing of the uint number instead.

    if (PyBytes_Check(vv))
    {
        try {
            return parse_balance(PyBytes_AsString(vv));
        } catch (const ammr::bad_argument &) {
            PyErr_SetString(PyExc_ValueError, "bad uint representation");
            return 0;
        }
    }

    PyObject *str_repr = PyObject_Str(vv);
    PyObject *encodedString = PyUnicode_AsEncodedString(str_repr, "UTF-8", "strict");
    balance_t res = 0;
    if (encodedString)
    {
        char *repr = PyBytes_AsString(encodedString);
        try {
            res = parse_balance(repr);
        }
        catch (const ammr::bad_argument &) {
            PyErr_SetString(PyExc_ValueError, "not an unsigned 256 bit integer");
        }
        Py_DECREF(encodedString);
    }
    else {
        PyErr_SetString(PyExc_ValueError, "bad uint representation");
    }
    Py_DECREF(str_repr);

    return res;
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
        // Grab pointer to memory into which to construct the new value
        balance_t* storage = reinterpret_cast<balance_t*>(((converter::rvalue_from_python_storage<balance_t>*)data)->storage.bytes);

        const auto val = PyLong_AsBalance(obj_ptr);
        if (PyErr_Occurred())
        {
            throw_error_already_set();
        }
        new (storage) balance_t(val);

        // Stash the memory chunk pointer for later use by boost.python
        data->convertible = storage;
    }
};


/**
 * @brief balance_t goes back to Python as a plain int
 */
struct balance_to_python_long
{
    static PyObject* convert(balance_t const& o)
    {
        std::stringstream ss;
        ss << o;
        return PyLong_FromString(ss.str().c_str(), nullptr, 0);
    }
};


/**
 * @brief Python sequence of addresses (or hexstrings) -> TokenPath
 */
struct token_path_from_python_sequence
{
    token_path_from_python_sequence()
    {
        converter::registry::push_back(
                    &convertible,
                    &construct,
                    boost::python::type_id<TokenPath>());
    }

    static void* convertible(PyObject* obj_ptr)
    {
        if (PySequence_Check(obj_ptr) && !PyUnicode_Check(obj_ptr) && !PyBytes_Check(obj_ptr))
        {
            return obj_ptr;
        }
        return 0;
    }

    static void construct(
        PyObject* obj_ptr,
        converter::rvalue_from_python_stage1_data* data)
    {
        TokenPath* storage = reinterpret_cast<TokenPath*>(((converter::rvalue_from_python_storage<TokenPath>*)data)->storage.bytes);
        object seq(handle<>(borrowed(obj_ptr)));
        const auto n = len(seq);
        new (storage) TokenPath();
        for (long i = 0; i < n; ++i)
        {
            storage->push_back(extract<address_t>(seq[i]));
        }
        data->convertible = storage;
    }
};


static void translate_bad_argument(const ammr::bad_argument &e)
{
    PyErr_SetString(PyExc_ValueError, e.what());
}

static void translate_address_error(const AddressFormatError &e)
{
    PyErr_SetString(PyExc_ValueError, e.what());
}


// by-value accessors for members whose type is a C++ class
template<typename C, typename T>
static object by_value(T C::*pm)
{
    return make_getter(pm, return_value_policy<return_by_value>());
}

template<typename T>
static T outcome_value(const Outcome<T> &o)
{
    return o.value;
}

static list outcome_amounts(const Outcome<AmountVector> &o)
{
    list res;
    for (const auto &a: o.value)
    {
        res.append(a);
    }
    return res;
}

static std::string address_str(const address_t &a)
{
    return a.str();
}


static LedgerPool *registry_create_pool(LedgerRegistry &registry, const address_t &tokenA, const address_t &tokenB)
{
    const auto res = registry.createPool(tokenA, tokenB);
    if (res.failed())
    {
        return nullptr;
    }
    return registry.lookup(res.value->address());
}

static LedgerPool *registry_lookup_pair(LedgerRegistry &registry, const address_t &tokenA, const address_t &tokenB)
{
    return registry.lookup(tokenA, tokenB);
}

static list registry_pools(const LedgerRegistry &registry)
{
    list res;
    for (auto p: registry.pools())
    {
        res.append(ptr(p));
    }
    return res;
}

static void ledger_set_transfer_hook(Ledger &ledger, const address_t &token, object cb)
{
    if (cb.is_none())
    {
        ledger.set_transfer_hook(token, transfer_hook_t());
        return;
    }
    ledger.set_transfer_hook(token, [cb](const address_t &t
                                         , const address_t &from
                                         , const address_t &to
                                         , const balance_t &amount) {
        cb(t, from, to, amount);
    });
}

static void py_log_register_sink(object sink)
{
    if (sink.is_none())
    {
        log_register_sink(log_sink_t());
        return;
    }
    log_register_sink([sink](log_level lvl, const char *msg) {
        try {
            sink(lvl, msg);
        } catch (const error_already_set &) {
            // a failing sink must not abort the operation being logged
            PyErr_Print();
        }
    });
}


/**
 * @brief Export C++ model to Python.
 *
 * This is what is seen by "import" of this CPython extension.
 */
BOOST_PYTHON_MODULE(ammr_model)
{
    using dont_make_copies = boost::noncopyable;
    using dont_manage_returned_pointer = return_value_policy<reference_existing_object>;
    using copy_address = return_value_policy<copy_const_reference>;

    balance_from_python_long();
    to_python_converter<balance_t, balance_to_python_long>();
    token_path_from_python_sequence();
    register_exception_translator<ammr::bad_argument>(&translate_bad_argument);
    register_exception_translator<AddressFormatError>(&translate_address_error);

    class_<address_t>("address_t")
            .def(init<const std::string &>())
            .def("is_zero", &address_t::is_zero)
            .def("__str__", &address_str)
            .def("__repr__", &address_str)
            .def("__hash__", static_cast<std::size_t (*)(const address_t &)>(&hash_value))
            .def(self == self)
            .def(self != self)
            .def(self < self)
            ;
    implicitly_convertible<std::string, address_t>();

    enum_<ReturnCode_e>("ReturnCode")
            .value("OK"                             , RC_OK)
            .value("EXPIRED"                        , RC_EXPIRED)
            .value("LOCKED"                         , RC_LOCKED)
            .value("INVALID_PATH"                   , RC_INVALID_PATH)
            .value("TRADE_NOT_ALLOWED"              , RC_TRADE_NOT_ALLOWED)
            .value("INSUFFICIENT_OUTPUT_AMOUNT"     , RC_INSUFFICIENT_OUTPUT_AMOUNT)
            .value("EXCESSIVE_INPUT_AMOUNT"         , RC_EXCESSIVE_INPUT_AMOUNT)
            .value("INSUFFICIENT_INPUT_AMOUNT"      , RC_INSUFFICIENT_INPUT_AMOUNT)
            .value("INSUFFICIENT_LIQUIDITY"         , RC_INSUFFICIENT_LIQUIDITY)
            .value("INSUFFICIENT_AMOUNT"            , RC_INSUFFICIENT_AMOUNT)
            .value("INSUFFICIENT_A_AMOUNT"          , RC_INSUFFICIENT_A_AMOUNT)
            .value("INSUFFICIENT_B_AMOUNT"          , RC_INSUFFICIENT_B_AMOUNT)
            .value("IDENTICAL_ADDRESSES"            , RC_IDENTICAL_ADDRESSES)
            .value("ZERO_ADDRESS"                   , RC_ZERO_ADDRESS)
            .value("PAIR_EXISTS"                    , RC_PAIR_EXISTS)
            .value("INVARIANT_VIOLATED"             , RC_INVARIANT_VIOLATED)
            .value("INSUFFICIENT_LIQUIDITY_MINTED"  , RC_INSUFFICIENT_LIQUIDITY_MINTED)
            .value("INSUFFICIENT_LIQUIDITY_BURNED"  , RC_INSUFFICIENT_LIQUIDITY_BURNED)
            .value("INSUFFICIENT_BALANCE"           , RC_INSUFFICIENT_BALANCE)
            .value("INSUFFICIENT_ALLOWANCE"         , RC_INSUFFICIENT_ALLOWANCE)
            .value("INVALID_SIGNATURE"              , RC_INVALID_SIGNATURE)
            .value("INSUFFICIENT_NATIVE_VALUE"      , RC_INSUFFICIENT_NATIVE_VALUE)
            .value("ARITHMETIC_OVERFLOW"            , RC_ARITHMETIC_OVERFLOW)
            ;

    class_<Status>("Status")
            .def_readonly("rc"      , &Status::rc)
            .def("ok"               , &Status::ok)
            .def("failed"           , &Status::failed)
            .def("describe"         , &Status::describe)
            ;
    class_<Outcome<balance_t>, bases<Status>>("BalanceOutcome", no_init)
            .add_property("value", &outcome_value<balance_t>)
            ;
    class_<Outcome<AmountVector>, bases<Status>>("AmountsOutcome", no_init)
            .add_property("value", &outcome_amounts)
            ;
    class_<Outcome<TokenAmounts>, bases<Status>>("TokenAmountsOutcome", no_init)
            .add_property("value", &outcome_value<TokenAmounts>)
            ;
    class_<Outcome<LiquidityReceipt>, bases<Status>>("LiquidityReceiptOutcome", no_init)
            .add_property("value", &outcome_value<LiquidityReceipt>)
            ;

    class_<TokenAmounts>("TokenAmounts")
            .add_property("amountA", by_value(&TokenAmounts::amountA))
            .add_property("amountB", by_value(&TokenAmounts::amountB))
            ;
    class_<LiquidityReceipt>("LiquidityReceipt")
            .add_property("amountA", by_value(&LiquidityReceipt::amountA))
            .add_property("amountB", by_value(&LiquidityReceipt::amountB))
            .add_property("shares" , by_value(&LiquidityReceipt::shares))
            ;

    enum_<TradeState_e>("TradeState")
            .value("SELL_ALL"           , TRADE_SELL_ALL)
            .value("SELL_TOKEN0_ONLY"   , TRADE_SELL_TOKEN0_ONLY)
            .value("SELL_TOKEN1_ONLY"   , TRADE_SELL_TOKEN1_ONLY)
            .value("SELL_NONE"          , TRADE_SELL_NONE)
            ;
    enum_<PricingMode_e>("PricingMode")
            .value("XYK"    , MODE_XYK)
            .value("XYBK"   , MODE_XYBK)
            ;

    class_<PoolSettings>("PoolSettings")
            .def_readwrite("feeBP"          , &PoolSettings::feeBP)
            .def_readwrite("tradeState"     , &PoolSettings::tradeState)
            .def_readwrite("mode"           , &PoolSettings::mode)
            .def_readwrite("boost0"         , &PoolSettings::boost0)
            .def_readwrite("boost1"         , &PoolSettings::boost1)
            .def("check_consistency"        , &PoolSettings::check_consistency)
            ;
    class_<Reserves>("Reserves")
            .add_property("reserve0", by_value(&Reserves::reserve0))
            .add_property("reserve1", by_value(&Reserves::reserve1))
            ;

    def("getAmountOut", &ammr::model::amm::getAmountOut);
    def("getAmountIn" , &ammr::model::amm::getAmountIn);
    def("quote"       , &ammr::model::amm::quote);

    class_<Ledger, dont_make_copies>("Ledger", no_init)
            .def("balanceOf"        , &Ledger::balanceOf)
            .def("allowance"        , &Ledger::allowance)
            .def("totalSupply"      , &Ledger::totalSupply)
            .def("transfer"         , &Ledger::transfer)
            .def("transferFrom"     , &Ledger::transferFrom)
            .def("approve"          , &Ledger::approve)
            .def("mint"             , &Ledger::mint)
            .def("burn"             , &Ledger::burn)
            .def("nativeBalanceOf"  , &Ledger::nativeBalanceOf)
            .def("creditNative"     , &Ledger::creditNative)
            .def("transferNative"   , &Ledger::transferNative)
            .def("now"              , &Ledger::now)
            .def("set_now"          , &Ledger::set_now)
            .def("feesPPM"          , &Ledger::feesPPM)
            .def("set_feesPPM"      , &Ledger::set_feesPPM)
            .def("set_transfer_hook", &ledger_set_transfer_hook)
            ;

    class_<LedgerPool, dont_make_copies>("Pool", no_init)
            .def("address"          , &LedgerPool::address  , copy_address())
            .def("token0"           , &LedgerPool::token0   , copy_address())
            .def("token1"           , &LedgerPool::token1   , copy_address())
            .def("getReserves"      , &LedgerPool::getReserves)
            .def("getSettings"      , &LedgerPool::getSettings)
            .def("totalSupply"      , &LedgerPool::totalSupply)
            .def("setSettings"      , &LedgerPool::setSettings)
            .def("makeXybk"         , &LedgerPool::makeXybk)
            .def("makeXyk"          , &LedgerPool::makeXyk)
            .def("updateTradeState" , &LedgerPool::updateTradeState)
            .def("setFee"           , &LedgerPool::setFee)
            .def("sync"             , &LedgerPool::sync)
            ;

    class_<LedgerRegistry, dont_make_copies>("Registry", no_init)
            .def("createPool"       , &registry_create_pool , dont_manage_returned_pointer())
            .def("lookup"           , &registry_lookup_pair , dont_manage_returned_pointer())
            .def("pools"            , &registry_pools)
            .def("__len__"          , &LedgerRegistry::size)
            .def("pool_address"     , &LedgerRegistry::pool_address)
            .staticmethod("pool_address")
            ;

    class_<ApprovalSignature>("ApprovalSignature")
            .def_readwrite("v"      , &ApprovalSignature::v)
            .add_property("r"       , by_value(&ApprovalSignature::r))
            .add_property("s"       , by_value(&ApprovalSignature::s))
            ;

    class_<LedgerPermit, dont_make_copies>("Permit", no_init)
            .def("register_key"     , &LedgerPermit::register_key)
            .def("nonces"           , &LedgerPermit::nonces)
            .def("sign"             , &LedgerPermit::sign)
            ;

    class_<WrappedNative, dont_make_copies>("WrappedNative", no_init)
            .def("token"            , &WrappedNative::token, copy_address())
            .def("deposit"          , &WrappedNative::deposit)
            .def("withdraw"         , &WrappedNative::withdraw)
            ;

    class_<RouterSettings>("RouterSettings")
            .add_property("router_address"  , by_value(&RouterSettings::router_address), make_setter(&RouterSettings::router_address))
            .add_property("wrapped_native"  , by_value(&RouterSettings::wrapped_native), make_setter(&RouterSettings::wrapped_native))
            .def_readwrite("max_path_length", &RouterSettings::max_path_length)
            .def_readwrite("refund_dust"    , &RouterSettings::refund_dust)
            .def("check_consistency"        , &RouterSettings::check_consistency)
            ;

    class_<CallContext>("CallContext")
            .add_property("sender", by_value(&CallContext::sender), make_setter(&CallContext::sender))
            .add_property("value" , by_value(&CallContext::value) , make_setter(&CallContext::value))
            ;

    class_<Router, dont_make_copies>("Router", no_init)
            .def("address"                          , &Router::address    , copy_address())
            .def("nativeToken"                      , &Router::nativeToken, copy_address())
            .def("addLiquidity"                     , &Router::addLiquidity)
            .def("addLiquidityNative"               , &Router::addLiquidityNative)
            .def("removeLiquidity"                  , &Router::removeLiquidity)
            .def("removeLiquidityNative"            , &Router::removeLiquidityNative)
            .def("removeLiquidityWithPermit"        , &Router::removeLiquidityWithPermit)
            .def("removeLiquidityNativeWithPermit"  , &Router::removeLiquidityNativeWithPermit)
            .def("swapExactTokensForTokens"         , &Router::swapExactTokensForTokens)
            .def("swapTokensForExactTokens"         , &Router::swapTokensForExactTokens)
            .def("swapExactNativeForTokens"         , &Router::swapExactNativeForTokens)
            .def("swapNativeForExactTokens"         , &Router::swapNativeForExactTokens)
            .def("swapExactTokensForNative"         , &Router::swapExactTokensForNative)
            .def("swapTokensForExactNative"         , &Router::swapTokensForExactNative)
            .def("swapExactTokensForTokensSupportingFeeOnTransferTokens", &Router::swapExactTokensForTokensSupportingFeeOnTransferTokens)
            .def("quote"                            , &Router::quote)
            .def("getAmountOut"                     , &Router::getAmountOut)
            .def("getAmountIn"                      , &Router::getAmountIn)
            .def("getAmountsOut"                    , &Router::getAmountsOut)
            .def("getAmountsIn"                     , &Router::getAmountsIn)
            ;

    class_<Deployment, dont_make_copies>("Deployment", init<const RouterSettings &>())
            .def(init<const RouterSettings &, const PoolSettings &>())
            .add_property("ledger"  , make_getter(&Deployment::ledger   , return_internal_reference<>()))
            .add_property("registry", make_getter(&Deployment::registry , return_internal_reference<>()))
            .add_property("native"  , make_getter(&Deployment::native   , return_internal_reference<>()))
            .add_property("permits" , make_getter(&Deployment::permits  , return_internal_reference<>()))
            .add_property("router"  , make_getter(&Deployment::router   , return_internal_reference<>()))
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
