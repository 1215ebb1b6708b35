#pragma once
#include "test_api_helper.hpp"
#include "../common/config.hpp"
#include "contracts.hpp"

namespace eosio { namespace testing {

namespace cfg = alloc::config;

struct alloc_pool_api: base_contract_api {
    alloc_pool_api(alloc_tester* tester, name code, symbol sym)
    :   base_contract_api(tester, code)
    ,   _symbol(sym) {}

    symbol _symbol;

    void initialize_contract(name token) {
        _tester->install_contract(_code, contracts::pool_wasm(), contracts::pool_abi());

        _tester->set_authority(_code, cfg::code_name, create_code_authority({_code}), "active");
        _tester->link_authority(_code, token, cfg::code_name, N(transfer));
        _tester->link_authority(_code, _code, cfg::code_name, N(unlock));
    }

    //// pool actions
    action_result create(asset supply) {
        BOOST_CHECK(_tester->has_link_authority(_code, cfg::code_name, cfg::token_name, N(transfer)));
        return push(N(create), _code, args()
            ("supply", supply)
        );
    }

    action_result distribute(name caller, name pool, asset quantity, name to) {
        return push(N(distribute), caller, args()
            ("caller", caller)
            ("pool", pool)
            ("quantity", quantity)
            ("to", to)
        );
    }

    action_result swap(name script, name pool, name to, asset quantity) {
        return push(N(swap), script, args()
            ("script", script)
            ("pool", pool)
            ("to", to)
            ("quantity", quantity)
        );
    }

    action_result unlock(name signer) {
        return push(N(unlock), signer, args());
    }

    action_result transfer_liq(name admin, name pool, asset quantity) {
        return push(N(transferliq), admin, args()
            ("admin", admin)
            ("pool", pool)
            ("quantity", quantity)
        );
    }

    //// pool tables
    variant get_pool(name label) const {
        return get_struct(_code, N(pools), label, "pool_info");
    }
    std::vector<variant> get_pools() const {
        return _tester->get_all_chaindb_rows(_code, _code, N(pools), false);
    }
    asset capacity(name label) const {
        return get_pool(label)["capacity"].as<asset>();
    }
    asset used(name label) const {
        return get_pool(label)["used"].as<asset>();
    }

    variant get_ledger() const {
        return get_singleton(N(ledger), "ledger_state");
    }
    bool locked() const {
        return get_ledger()["locked"].as<bool>();
    }
};


}} // eosio::testing
