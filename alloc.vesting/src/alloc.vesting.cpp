#include "alloc.vesting/alloc.vesting.hpp"
#include "alloc.vesting/release.hpp"
#include <alloc.access/alloc.access.hpp>
#include <alloc.pool/alloc.pool.hpp>
#include <common/upsert.hpp>
#include <eosio/event.hpp>
#include <algorithm>

namespace alloc {


using namespace eosio;

struct vesting_params_setter: set_params_visitor<vesting_state> {
    using set_params_visitor::set_params_visitor; // enable constructor

    bool operator()(const vesting_token& p) {
        return set_param(p, &vesting_state::token);
    }

    bool operator()(const vesting_limits& p) {
        return set_param(p, &vesting_state::limits);
    }
};

void vesting::validateprms(std::vector<vesting_param> params) {
    param_helper::check_params(params, _cfg.exists());
}

void vesting::setparams(std::vector<vesting_param> params) {
    require_auth(_self);
    auto setter = param_helper::set_parameters<vesting_params_setter>(params, _cfg, _self);

    stat_singleton stat(_self, _self.value);
    if (!stat.exists()) {
        stat.set(vesting_stat{0, asset(0, setter.state.token.token_symbol), false}, _self);
    }
}

////////////////////////////////////////////////////////////////
/// plans
void vesting::createplan(name admin, time_point_sec start_date, uint32_t cliff, uint32_t duration,
    bool revocable, uint16_t initial_release_pct, name pool
) {
    require_auth(admin);
    access::require_admin(config::access_name, admin);

    eosio::check(duration > 0, "duration must be positive");
    eosio::check(cliff <= duration, "cliff > duration");
    eosio::check(start_date >= time_point_sec(eosio::current_time_point()), "start date is in the past");
    eosio::check(initial_release_pct <= config::_100percent, "initial release percent > 100%");
    eosio::check(ledger::exists(config::pool_name, pool), "unknown pool");

    auto s = get_stat();
    plan_table plans(_self, _self.value);
    plans.emplace(_self, [&](auto& p) {
        p.id = s.plan_count;
        p.start_date = start_date;
        p.cliff = cliff;
        p.duration = duration;
        p.revocable = revocable;
        p.initial_release_pct = initial_release_pct;
        p.pool = pool;
        eosio::event(_self, "plancreated"_n, p).send();
    });
    s.plan_count++;
    set_stat(s);
}

void vesting::settrigger(name admin, uint64_t plan_id, time_point_sec time) {
    require_auth(admin);
    access::require_admin(config::access_name, admin);

    const auto plan = get_plan(_self, plan_id);
    eosio::check(time >= plan.start_date, "trigger time before plan start");

    trigger_table triggers(_self, _self.value);
    upsert(triggers, plan_id, _self, [&](auto& t, bool) {
        t.plan_id = plan_id;
        t.time = time;
    });
    eosio::event(_self, "triggerset"_n, std::make_tuple(plan_id, time)).send();
}

////////////////////////////////////////////////////////////////
/// grants
void vesting::issuegrant(name issuer, name beneficiary, time_point_sec start_date, asset quantity, uint64_t plan_id) {
    require_auth(issuer);
    access::require_admin_or_approved(config::access_name, issuer);
    access::require_not_paused(config::access_name);

    eosio::check(beneficiary != name(), "invalid beneficiary");
    eosio::check(is_account(beneficiary), "beneficiary account does not exist");
    check_quantity(quantity);
    // plan_id == plan_count is not a plan yet, `get_plan` rejects it
    const auto plan = get_plan(_self, plan_id);
    eosio::check(start_date >= plan.start_date, "start date before plan start");

    grant_table grants(_self, beneficiary.value);
    auto idx = grants.get_index<"byplan"_n>();
    uint32_t count = 0;
    for (auto itr = idx.lower_bound(std::make_tuple(plan_id, uint64_t(0)));
        itr != idx.end() && itr->plan_id == plan_id; ++itr
    ) {
        count++;
    }
    eosio::check(count < params().limits.max_grants, "grant limit reached");

    grants.emplace(_self, [&](auto& g) {
        g.id = grants.available_primary_key();
        g.plan_id = plan_id;
        g.beneficiary = beneficiary;
        g.start_date = start_date;
        g.total = quantity;
        g.claimed = asset(0, quantity.symbol);
        eosio::event(_self, "grantcreated"_n, g).send();
    });

    holder_table holders(_self, _self.value);
    upsert(holders, beneficiary.value, _self, [&](auto& h, bool exists) {
        if (!exists) {
            h.account = beneficiary;
            h.grant_count = 0;
            h.total_granted = asset(0, quantity.symbol);
            h.total_claimed = asset(0, quantity.symbol);
        }
        h.grant_count++;
        h.total_granted += quantity;
    });

    auto s = get_stat();
    s.total_vesting += quantity;
    set_stat(s);
}

////////////////////////////////////////////////////////////////
/// settlement
void vesting::claim(name beneficiary, uint64_t plan_id) {
    require_auth(beneficiary);
    access::require_not_paused(config::access_name);

    const auto plan = get_plan(_self, plan_id);
    eosio::check(!is_revoked(_self, beneficiary, plan_id), "already revoked");

    lock_reentrancy();
    auto amount = settle(beneficiary, plan);
    eosio::check(amount.amount > 0, "nothing to claim");
    payout(beneficiary, plan, amount);
    schedule_unlock();
}

void vesting::revoke(name admin, name beneficiary, uint64_t plan_id) {
    require_auth(admin);
    access::require_admin(config::access_name, admin);
    access::require_not_paused(config::access_name);

    const auto plan = get_plan(_self, plan_id);
    eosio::check(plan.revocable, "plan is not revocable");
    revocation_table revoked(_self, beneficiary.value);
    eosio::check(revoked.find(plan_id) == revoked.end(), "already revoked");

    lock_reentrancy();
    auto amount = settle(beneficiary, plan);
    if (amount.amount > 0) {
        payout(beneficiary, plan, amount);
    } else {
        print("revoke: nothing vested to release\n");
    }

    revoked.emplace(_self, [&](auto& r) {
        r.plan_id = plan_id;
        r.revoked_at = eosio::current_time_point();
    });
    eosio::event(_self, "revoked"_n, std::make_tuple(beneficiary, plan_id, amount)).send();
    schedule_unlock();
}

void vesting::writeoffdebt(name caller, name beneficiary, asset quantity) {
    require_auth(caller);
    access::require_admin_or_approved(config::access_name, caller);
    check_quantity(quantity);

    holder_table holders(_self, _self.value);
    auto holder = holders.find(beneficiary.value);
    eosio::check(holder != holders.end() && quantity <= holder->unclaimed(), "debt exceeds entitlement");

    lock_reentrancy();
    revocation_table revoked(_self, beneficiary.value);
    grant_table grants(_self, beneficiary.value);
    auto idx = grants.get_index<"byplan"_n>();
    auto debt = quantity.amount;
    auto itr = idx.begin();
    while (itr != idx.end() && debt > 0) {
        const auto plan_id = itr->plan_id;
        if (revoked.find(plan_id) != revoked.end()) {
            itr = idx.lower_bound(std::make_tuple(plan_id + 1, uint64_t(0)));
            continue;
        }
        int64_t plan_debt = 0;
        for (; itr != idx.end() && itr->plan_id == plan_id && debt > 0; ++itr) {
            auto step = std::min(debt, itr->total.amount - itr->claimed.amount);
            if (step <= 0) {
                continue;
            }
            idx.modify(itr, same_payer, [&](auto& g) {
                g.claimed.amount += step;
            });
            plan_debt += step;
            debt -= step;
        }
        if (plan_debt > 0) {
            eosio::event(_self, "plandebt"_n,
                std::make_tuple(beneficiary, plan_id, asset(plan_debt, quantity.symbol))).send();
        }
    }
    // unvested parts of revoked grants count in `unclaimed` but can't be written off
    eosio::check(debt == 0, "debt exceeds entitlement");

    holders.modify(holder, same_payer, [&](auto& h) {
        h.total_claimed += quantity;
    });
    auto s = get_stat();
    s.total_vesting -= quantity;
    set_stat(s);
    eosio::event(_self, "debt"_n, std::make_tuple(beneficiary, quantity)).send();
    schedule_unlock();
}

void vesting::unlock() {
    require_auth(_self);
    auto s = get_stat();
    eosio::check(s.locked, "not locked");
    s.locked = false;
    set_stat(s);
}

// Computes and commits in one pass: every grant's `claimed` is moved up to its released level
asset vesting::settle(name beneficiary, const plan_info& plan) {
    grant_table grants(_self, beneficiary.value);
    auto idx = grants.get_index<"byplan"_n>();
    auto itr = idx.lower_bound(std::make_tuple(plan.id, uint64_t(0)));
    eosio::check(itr != idx.end() && itr->plan_id == plan.id, "no grants for this plan");

    // unset trigger reads as epoch
    const auto trigger = get_trigger(_self, plan.id);
    eosio::check(trigger > plan.start_date, "trigger time is not set");

    const release::schedule sched{trigger.utc_seconds, plan.cliff, plan.duration, plan.initial_release_pct};
    const uint64_t now = eosio::current_time_point().sec_since_epoch();

    asset total(0, token_symbol());
    for (; itr != idx.end() && itr->plan_id == plan.id; ++itr) {
        eosio::check(itr->beneficiary == beneficiary, "SYSTEM: grant beneficiary mismatch");   // must not happen
        if (itr->claimed >= itr->total) {
            continue;
        }
        auto available = release::claimable(sched, itr->total.amount, itr->claimed.amount, now);
        if (available > 0) {
            idx.modify(itr, same_payer, [&](auto& g) {
                g.claimed.amount += available;
            });
            total.amount += available;
        }
    }
    return total;
}

void vesting::payout(name beneficiary, const plan_info& plan, const asset& quantity) {
    holder_table holders(_self, _self.value);
    const auto& holder = holders.get(beneficiary.value, "SYSTEM: holder not found");   // must not happen
    holders.modify(holder, same_payer, [&](auto& h) {
        h.total_claimed += quantity;
    });
    auto s = get_stat();
    s.total_vesting -= quantity;
    set_stat(s);
    eosio::event(_self, "claimed"_n, std::make_tuple(beneficiary, plan.id, quantity)).send();

    INLINE_ACTION_SENDER(ledger, distribute)(config::pool_name, {_self, config::code_name},
        {_self, plan.pool, quantity, beneficiary});
}

void vesting::check_quantity(const asset& quantity) {
    eosio::check(quantity.is_valid(), "invalid quantity");
    eosio::check(quantity.amount > 0, "quantity must be positive");
    eosio::check(quantity.symbol == token_symbol(), "symbol precision mismatch");
}

////////////////////////////////////////////////////////////////
/// state and reentrancy lock
vesting_stat vesting::get_stat() {
    params();
    stat_singleton stat(_self, _self.value);
    return stat.get();
}

void vesting::set_stat(const vesting_stat& s) {
    stat_singleton stat(_self, _self.value);
    stat.set(s, _self);
}

void vesting::lock_reentrancy() {
    auto s = get_stat();
    eosio::check(!s.locked, "reentrant call");
    s.locked = true;
    set_stat(s);
}

// inline actions run depth-first in order, so `unlock` queued last runs after
// the release transfer and everything it triggers
void vesting::schedule_unlock() {
    action(permission_level{_self, config::code_name}, _self, "unlock"_n, std::tuple<>()).send();
}

} // alloc

EOSIO_DISPATCH(alloc::vesting, (validateprms)(setparams)(createplan)(settrigger)(issuegrant)
    (claim)(revoke)(writeoffdebt)(unlock))
