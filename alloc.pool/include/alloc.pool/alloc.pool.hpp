#pragma once
#include <common/config.hpp>
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <string>

namespace alloc {

using namespace eosio;


struct [[eosio::table]] pool_info {
    name label;
    asset capacity;         // authorized to be paid out of this pool
    asset used;             // already paid out

    uint64_t primary_key() const {
        return label.value;
    }

    asset unused() const {
        return capacity - used;
    }
};
using pool_table [[using eosio: order("label","asc"), contract("alloc.pool")]] = eosio::multi_index<"pools"_n, pool_info>;

struct [[eosio::table]] ledger_state {
    asset supply;
    bool locked;            // set while a payout and its inline actions run
};
using ledger_singleton [[using eosio: order("id","asc"), contract("alloc.pool")]] = eosio::singleton<"ledger"_n, ledger_state>;


class [[eosio::contract("alloc.pool")]] ledger: public contract {
public:
    using contract::contract;

    [[eosio::action]] void create(asset supply);

    [[eosio::action]] void distribute(name caller, name pool, asset quantity, name to);
    [[eosio::action]] void swap(name script, name pool, name to, asset quantity);
    [[eosio::action]] void transferliq(name admin, name pool, asset quantity);

    [[eosio::action]] void unlock();

    // interface for external contracts
    static inline bool exists(name code, name label) {
        pool_table pools(code, code.value);
        return pools.find(label.value) != pools.end();
    }
    static inline asset unused(name code, name label) {
        pool_table pools(code, code.value);
        return pools.get(label.value, "unknown pool").unused();
    }

private:
    void lock_reentrancy();
    void schedule_unlock();

    void disburse(name pool, asset quantity, name to, name event, const std::string& memo);
    void check_quantity(const asset& quantity);
    static void check_swappable(name pool);
};

} // alloc
