#pragma once
#include <common/config.hpp>
#include <eosio/eosio.hpp>
#include <eosio/time.hpp>
#include <eosio/singleton.hpp>

namespace alloc {

using namespace eosio;


struct [[eosio::table]] role_holder {
    name account;
    time_point_sec since;

    uint64_t primary_key() const {
        return account.value;
    }
};
using role_table [[using eosio: order("account","asc"), scope_type("name"), contract("alloc.access")]] = eosio::multi_index<"roles"_n, role_holder>;

struct [[eosio::table]] gate_state {
    bool paused = false;
};
using gate_singleton [[using eosio: order("id","asc"), contract("alloc.access")]] = eosio::singleton<"gate"_n, gate_state>;


class [[eosio::contract("alloc.access")]] access: public contract {
public:
    using contract::contract;

    [[eosio::action]] void addrole(name account, name role);
    [[eosio::action]] void removerole(name account, name role);
    [[eosio::action]] void pause(name admin);
    [[eosio::action]] void unpause(name admin);

    // interface for external contracts
    // gate account is the owner and holds every role
    static inline bool has_role(name code, name role, name account) {
        if (account == code) {
            return true;
        }
        role_table tbl(code, role.value);
        return tbl.find(account.value) != tbl.end();
    }

    static inline bool is_paused(name code) {
        gate_singleton gate(code, code.value);
        return gate.exists() && gate.get().paused;
    }

    static inline void require_admin(name code, name account) {
        eosio::check(has_role(code, config::admin_role, account), "caller is not an admin");
    }
    static inline void require_script(name code, name account) {
        eosio::check(has_role(code, config::script_role, account), "caller is not a script");
    }
    static inline void require_approved(name code, name account) {
        eosio::check(has_role(code, config::approved_role, account), "caller is not an approved contract");
    }
    static inline void require_admin_or_approved(name code, name account) {
        eosio::check(has_role(code, config::admin_role, account) || has_role(code, config::approved_role, account),
            "caller is neither an admin nor an approved contract");
    }
    static inline void require_not_paused(name code) {
        eosio::check(!is_paused(code), "operations are paused");
    }

private:
    void set_paused(name admin, bool value);
    void send_role_event(name event, name account, name role);
};

} // alloc
