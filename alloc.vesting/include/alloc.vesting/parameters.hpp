#pragma once
#include <common/parameter.hpp>
#include <common/config.hpp>
#include <eosio/singleton.hpp>
#include <eosio/symbol.hpp>


namespace alloc {


using namespace eosio;

struct vesting_token: immutable_parameter {
    symbol token_symbol;

    void validate() const {
        eosio::check(token_symbol.is_valid(), "invalid token symbol");
    }

    EOSLIB_SERIALIZE(vesting_token, (token_symbol))
};

// bounds settlement loops of one (beneficiary, plan) pair
struct vesting_limits: parameter {
    uint16_t max_grants;

    void validate() const {
        eosio::check(max_grants > 0, "max_grants must be positive");
    }

    EOSLIB_SERIALIZE(vesting_limits, (max_grants))
};

using vesting_param = std::variant<vesting_token, vesting_limits>;

struct vesting_state {
    vesting_token token;
    vesting_limits limits;

    static constexpr int params_count = 2;

    EOSLIB_SERIALIZE(vesting_state, (token)(limits))
};
using vesting_params_singleton [[using eosio: order("id","asc"), contract("alloc.vesting")]] = eosio::singleton<"vestparams"_n, vesting_state>;

} // alloc
