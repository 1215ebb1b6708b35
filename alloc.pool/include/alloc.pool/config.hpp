#pragma once
#include <common/config.hpp>
#include <array>

namespace alloc { namespace config {

struct pool_share {
    eosio::name label;
    uint16_t share;         // of the issued supply, in basis points
};

// reserve must stay the last one: it receives the rounding remainder
static const std::array<pool_share, 8> pool_shares = {{
    {"seed"_n,          1000},
    {"private"_n,       1200},
    {"public"_n,         500},
    {"team"_n,          1500},
    {"advisors"_n,       500},
    {"liquidity"_n,     1000},
    {"gametreasury"_n,  2800},
    {"reserve"_n,       1500}
}};

static const auto reserve_pool = "reserve"_n;
static const std::array<eosio::name, 2> swap_pools = {{"gametreasury"_n, "liquidity"_n}};

static const auto distribute_memo = "vesting release";
static const auto swap_memo = "swap";

}} // alloc::config
