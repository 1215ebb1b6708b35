#include "alloc.access/alloc.access.hpp"
#include <eosio/event.hpp>

namespace alloc {


using namespace eosio;

static bool is_known_role(name role) {
    return role == config::admin_role
        || role == config::script_role
        || role == config::approved_role
        || role == config::distributor_role;
}

void access::addrole(name account, name role) {
    require_auth(_self);
    eosio::check(is_known_role(role), "unknown role");
    eosio::check(is_account(account), "account does not exist");
    eosio::check(account != _self, "owner already holds every role");

    role_table tbl(_self, role.value);
    eosio::check(tbl.find(account.value) == tbl.end(), "role already granted");
    tbl.emplace(_self, [&](auto& r) {
        r.account = account;
        r.since = eosio::current_time_point();
    });
    send_role_event("roleadded"_n, account, role);
}

void access::removerole(name account, name role) {
    require_auth(_self);
    eosio::check(is_known_role(role), "unknown role");

    role_table tbl(_self, role.value);
    const auto& r = tbl.get(account.value, "role is not granted");
    tbl.erase(r);
    send_role_event("roleremoved"_n, account, role);
}

void access::pause(name admin) {
    set_paused(admin, true);
}

void access::unpause(name admin) {
    set_paused(admin, false);
}

void access::set_paused(name admin, bool value) {
    require_auth(admin);
    require_admin(_self, admin);

    gate_singleton gate(_self, _self.value);
    auto s = gate.get_or_default();
    eosio::check(s.paused != value, value ? "already paused" : "not paused");
    s.paused = value;
    gate.set(s, _self);
    eosio::event(_self, "paused"_n, std::make_tuple(admin, value)).send();
}

void access::send_role_event(name event, name account, name role) {
    eosio::event(_self, event, std::make_tuple(account, role)).send();
}

} // alloc

EOSIO_DISPATCH(alloc::access, (addrole)(removerole)(pause)(unpause))
