#pragma once
#include "alloc.vesting/parameters.hpp"
#include <common/config.hpp>
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/time.hpp>
#include <eosio/singleton.hpp>
#include <vector>

namespace alloc {

using namespace eosio;


struct [[eosio::table]] plan_info {
    uint64_t id;
    time_point_sec start_date;
    uint32_t cliff;                 // seconds after trigger time
    uint32_t duration;              // seconds after trigger time
    bool revocable;
    uint16_t initial_release_pct;   // basis points
    name pool;                      // label of the alc.pool pool paying this plan

    uint64_t primary_key() const {
        return id;
    }
};
using plan_table [[using eosio: order("id","asc"), contract("alloc.vesting")]] = eosio::multi_index<"plans"_n, plan_info>;

struct [[eosio::table]] trigger_info {
    uint64_t plan_id;
    time_point_sec time;

    uint64_t primary_key() const {
        return plan_id;
    }
};
using trigger_table [[using eosio: order("plan_id","asc"), contract("alloc.vesting")]] = eosio::multi_index<"triggers"_n, trigger_info>;

// scope: beneficiary
struct [[eosio::table]] grant_info {
    uint64_t id;                    // ascending in creation order
    uint64_t plan_id;
    name beneficiary;
    time_point_sec start_date;
    asset total;
    asset claimed;

    uint64_t primary_key() const {
        return id;
    }
};
using grant_plan_index [[using eosio: order("plan_id","asc"), order("id","asc")]] =
    eosio::indexed_by<"byplan"_n, composite_key<grant_info,
        member<grant_info, uint64_t, &grant_info::plan_id>,
        member<grant_info, uint64_t, &grant_info::id>>>;
using grant_table [[using eosio: order("id","asc"), scope_type("name"), contract("alloc.vesting")]] =
    eosio::multi_index<"grants"_n, grant_info, grant_plan_index>;

struct [[eosio::table]] holder_stat {
    name account;
    uint32_t grant_count;
    asset total_granted;
    asset total_claimed;

    uint64_t primary_key() const {
        return account.value;
    }

    asset unclaimed() const {
        return total_granted - total_claimed;
    }
};
using holder_table [[using eosio: order("account","asc"), contract("alloc.vesting")]] = eosio::multi_index<"holders"_n, holder_stat>;

// scope: beneficiary
struct [[eosio::table]] revocation {
    uint64_t plan_id;
    time_point_sec revoked_at;

    uint64_t primary_key() const {
        return plan_id;
    }
};
using revocation_table [[using eosio: order("plan_id","asc"), scope_type("name"), contract("alloc.vesting")]] =
    eosio::multi_index<"revoked"_n, revocation>;

struct [[eosio::table]] vesting_stat {
    uint64_t plan_count;
    asset total_vesting;            // granted minus claimed over all holders
    bool locked;                    // set while a guarded action and its inline actions run
};
using stat_singleton [[using eosio: order("id","asc"), contract("alloc.vesting")]] = eosio::singleton<"state"_n, vesting_stat>;


class [[eosio::contract("alloc.vesting")]] vesting: public contract {
public:
    vesting(name self, name code, datastream<const char*> ds)
        : contract(self, code, ds)
        , _cfg(_self, _self.value)
    {
    }

    [[eosio::action]] void validateprms(std::vector<vesting_param> params);
    [[eosio::action]] void setparams(std::vector<vesting_param> params);

    [[eosio::action]] void createplan(name admin, time_point_sec start_date, uint32_t cliff, uint32_t duration,
        bool revocable, uint16_t initial_release_pct, name pool);
    [[eosio::action]] void settrigger(name admin, uint64_t plan_id, time_point_sec time);
    [[eosio::action]] void issuegrant(name issuer, name beneficiary, time_point_sec start_date, asset quantity,
        uint64_t plan_id);

    [[eosio::action]] void claim(name beneficiary, uint64_t plan_id);
    [[eosio::action]] void revoke(name admin, name beneficiary, uint64_t plan_id);
    [[eosio::action]] void writeoffdebt(name caller, name beneficiary, asset quantity);

    [[eosio::action]] void unlock();

    // interface for external contracts
    static inline plan_info get_plan(name code, uint64_t plan_id) {
        plan_table plans(code, code.value);
        return plans.get(plan_id, "unknown plan");
    }
    static inline time_point_sec get_trigger(name code, uint64_t plan_id) {
        trigger_table triggers(code, code.value);
        auto itr = triggers.find(plan_id);
        return itr != triggers.end() ? itr->time : time_point_sec();
    }
    static inline bool is_revoked(name code, name beneficiary, uint64_t plan_id) {
        revocation_table revoked(code, beneficiary.value);
        return revoked.find(plan_id) != revoked.end();
    }

private:
    vesting_params_singleton _cfg;
    const vesting_state& params() {
        eosio::check(_cfg.exists(), "not initialized");
        static const vesting_state cfg = _cfg.get();
        return cfg;
    }
    symbol token_symbol() {
        return params().token.token_symbol;
    }

    vesting_stat get_stat();
    void set_stat(const vesting_stat& s);
    void lock_reentrancy();
    void schedule_unlock();

    void check_quantity(const asset& quantity);
    asset settle(name beneficiary, const plan_info& plan);
    void payout(name beneficiary, const plan_info& plan, const asset& quantity);
};

} // alloc
