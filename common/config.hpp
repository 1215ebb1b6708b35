#pragma once

#ifdef UNIT_TEST_ENV
#   include <eosio/chain/types.hpp>
template <typename T, T... Str>
inline eosio::chain::name operator ""_n() {
   return eosio::chain::name({Str...});
}
#else
#   include <eosio/name.hpp>
#endif
#include <cstdint>

namespace alloc { namespace config {

// contracts
static const auto access_name = "alc.access"_n;
static const auto vesting_name = "alc.vesting"_n;
static const auto pool_name = "alc.pool"_n;
static const auto token_name = "cyber.token"_n;

// permissions
static const auto code_name = "eosio.code"_n;
static const auto owner_name = "owner"_n;
static const auto active_name = "active"_n;

// roles, checked through alc.access
static const auto admin_role = "admin"_n;
static const auto script_role = "script"_n;
static const auto approved_role = "approved"_n;
static const auto distributor_role = "distributor"_n;

// numbers and time
static constexpr auto _1percent = 100;
static constexpr auto _100percent = 100 * _1percent;
static constexpr uint32_t seconds_per_day = 24*60*60;

} // config

constexpr uint32_t days(uint32_t n) {
    return n * config::seconds_per_day;
}

} // alloc::config
