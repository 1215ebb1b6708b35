#pragma once
#include <cstdint>

// Unlock curve shared by the contract and native tests, so no eosio types here
namespace alloc { namespace release {

static constexpr int64_t bp_scale = 10000;

struct schedule {
    uint32_t trigger;           // UTC seconds, anchor of cliff and duration
    uint32_t cliff;             // seconds
    uint32_t duration;          // seconds, > 0 and >= cliff
    uint16_t initial_pct;       // basis points unlocked at trigger

    uint64_t cliff_date() const {
        return uint64_t(trigger) + cliff;
    }
    uint64_t end_date() const {
        return uint64_t(trigger) + duration;
    }
};

inline int64_t initial_slice(int64_t total, uint16_t pct) {
    return static_cast<int64_t>(static_cast<__int128>(total) * pct / bp_scale);
}

// part of `total` unlocked at `now`
inline int64_t released(const schedule& s, int64_t total, uint64_t now) {
    const auto end = s.end_date();
    if (now >= end) {
        return total;
    }
    if (now < s.trigger) {
        return 0;
    }
    const auto initial = initial_slice(total, s.initial_pct);
    const auto cliff = s.cliff_date();
    if (now <= cliff) {
        return initial;
    }
    const auto linear = static_cast<__int128>(total - initial) * (now - cliff) / (end - cliff);
    return initial + static_cast<int64_t>(linear);
}

inline int64_t claimable(const schedule& s, int64_t total, int64_t claimed, uint64_t now) {
    const auto r = released(s, total, now);
    return r > claimed ? r - claimed : 0;
}

}} // alloc::release
