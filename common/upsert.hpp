#pragma once
#include <eosio/eosio.hpp>

namespace alloc {


// Modifies the row `key` of `tbl` or emplaces it. `update(item, exists)` fills the row.
// Returns true if the row existed before
template<typename T, typename F>
bool upsert(T& tbl, uint64_t key, eosio::name payer, F&& update) {
    auto itr = tbl.find(key);
    const bool exists = itr != tbl.end();
    if (exists) {
        tbl.modify(itr, payer, [&](auto& item) { update(item, true); });
    } else {
        tbl.emplace(payer, [&](auto& item) { update(item, false); });
    }
    return exists;
}


} // alloc
