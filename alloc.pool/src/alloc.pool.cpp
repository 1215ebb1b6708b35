#include "alloc.pool/alloc.pool.hpp"
#include "alloc.pool/config.hpp"
#include <alloc.access/alloc.access.hpp>
#include <cyber.token/cyber.token.hpp>
#include <eosio/event.hpp>
#include <algorithm>

namespace alloc {


using namespace eosio;

void ledger::create(asset supply) {
    require_auth(_self);
    eosio::check(supply.is_valid(), "invalid supply");
    eosio::check(supply.amount > 0, "supply must be positive");
    eosio::check(access::has_role(config::access_name, config::distributor_role, _self),
        "ledger is not a registered distributor");
    eosio::check(token::get_balance(config::token_name, _self, supply.symbol.code()) == supply,
        "ledger must hold the whole supply");

    ledger_singleton state(_self, _self.value);
    eosio::check(!state.exists(), "ledger already created");
    state.set(ledger_state{supply, false}, _self);

    uint32_t total_share = 0;
    for (const auto& s: config::pool_shares) {
        total_share += s.share;
    }
    eosio::check(total_share == config::_100percent, "SYSTEM: pool shares must sum to 100%");  // must not happen

    pool_table pools(_self, _self.value);
    auto rest = supply.amount;
    for (size_t i = 0; i < config::pool_shares.size(); i++) {
        const auto& s = config::pool_shares[i];
        const bool last = i + 1 == config::pool_shares.size();
        auto amount = last
            ? rest
            : static_cast<int64_t>(static_cast<__int128>(supply.amount) * s.share / config::_100percent);
        rest -= amount;
        pools.emplace(_self, [&](auto& p) {
            p.label = s.label;
            p.capacity = asset(amount, supply.symbol);
            p.used = asset(0, supply.symbol);
        });
    }
}

void ledger::distribute(name caller, name pool, asset quantity, name to) {
    require_auth(caller);
    access::require_approved(config::access_name, caller);
    access::require_not_paused(config::access_name);

    lock_reentrancy();
    disburse(pool, quantity, to, "distributed"_n, config::distribute_memo);
    schedule_unlock();
}

void ledger::swap(name script, name pool, name to, asset quantity) {
    require_auth(script);
    access::require_script(config::access_name, script);
    access::require_not_paused(config::access_name);
    check_swappable(pool);

    lock_reentrancy();
    disburse(pool, quantity, to, "swapped"_n, config::swap_memo);
    schedule_unlock();
}

void ledger::transferliq(name admin, name pool, asset quantity) {
    require_auth(admin);
    access::require_admin(config::access_name, admin);
    check_swappable(pool);
    check_quantity(quantity);

    pool_table pools(_self, _self.value);
    eosio::check(quantity <= unused(_self, config::reserve_pool), "insufficient reserve capacity");
    const auto& reserve = pools.get(config::reserve_pool.value, "unknown pool");
    const auto& target = pools.get(pool.value, "unknown pool");

    pools.modify(reserve, same_payer, [&](auto& p) {
        p.capacity -= quantity;
    });
    pools.modify(target, same_payer, [&](auto& p) {
        p.capacity += quantity;
    });
    eosio::event(_self, "liqmoved"_n, std::make_tuple(config::reserve_pool, pool, quantity)).send();
}

void ledger::unlock() {
    require_auth(_self);
    ledger_singleton state(_self, _self.value);
    auto s = state.get_or_default();
    eosio::check(s.locked, "not locked");
    s.locked = false;
    state.set(s, _self);
}

void ledger::disburse(name pool, asset quantity, name to, name event, const std::string& memo) {
    eosio::check(to != name() && to != _self, "invalid recipient");
    eosio::check(is_account(to), "recipient account does not exist");
    check_quantity(quantity);

    pool_table pools(_self, _self.value);
    const auto& p = pools.get(pool.value, "unknown pool");
    eosio::check(quantity <= p.unused(), "pool capacity exceeded");
    pools.modify(p, same_payer, [&](auto& item) {
        item.used += quantity;
    });
    eosio::event(_self, event, std::make_tuple(pool, to, quantity)).send();

    // the transfer runs after all the bookkeeping above, its failure reverts it
    INLINE_ACTION_SENDER(eosio::token, transfer)(config::token_name, {_self, config::code_name},
        {_self, to, quantity, memo});
}

void ledger::check_quantity(const asset& quantity) {
    eosio::check(quantity.is_valid(), "invalid quantity");
    eosio::check(quantity.amount > 0, "quantity must be positive");

    ledger_singleton state(_self, _self.value);
    eosio::check(state.exists(), "not initialized");
    eosio::check(quantity.symbol == state.get().supply.symbol, "symbol precision mismatch");
}

void ledger::lock_reentrancy() {
    ledger_singleton state(_self, _self.value);
    eosio::check(state.exists(), "not initialized");
    auto s = state.get();
    eosio::check(!s.locked, "reentrant call");
    s.locked = true;
    state.set(s, _self);
}

// queued after the transfer, so it runs once the transfer and its notifications are done
void ledger::schedule_unlock() {
    action(permission_level{_self, config::code_name}, _self, "unlock"_n, std::tuple<>()).send();
}

void ledger::check_swappable(name pool) {
    const auto& pools = config::swap_pools;
    eosio::check(std::find(pools.begin(), pools.end(), pool) != pools.end(), "pool is not swappable");
}

} // alloc

EOSIO_DISPATCH(alloc::ledger, (create)(distribute)(swap)(transferliq)(unlock))
