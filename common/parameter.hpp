#pragma once
#include <eosio/eosio.hpp>
#include <eosio/datastream.hpp>
#include <variant>
#include <vector>
#include <set>
#include <type_traits>

namespace alloc {


// Base to inherit other parameters
struct parameter {
    // validates parameter value(s), aborts if invalid
    void validate() const {};
};

// Can be set only by the very first `setparams`
struct immutable_parameter: parameter {
};


template<typename S>
struct set_params_visitor {
    using state_type = S;

    S state;
    const bool exists;

    set_params_visitor(const S& s, bool e): state(s), exists(e) {}

    // returns true if value changed
    template<typename T, typename F>
    bool set_param(const T& value, F S::*field) {
        auto& param = state.*field;
        bool changed = !exists || eosio::pack(param) != eosio::pack(value);
        if (changed) {
            if constexpr (std::is_base_of_v<immutable_parameter, T>) {
                eosio::check(!exists, "can't change immutable parameter");
            }
            param = value;
        }
        return changed;
    }
};


struct param_helper {
    template<typename T>
    static void check_params(const std::vector<T>& params, bool exists) {
        eosio::check(params.size(), "empty params not allowed");
        check_dups(params);
        validate_params(params);
        eosio::check(exists || params.size() == std::variant_size_v<T>, "must provide all parameters in initial set");
    }

    template<typename T>
    static void validate_params(const std::vector<T>& params) {
        for (const auto& param: params) {
            std::visit([](const auto& p) {
                p.validate();
            }, param);
        }
    }

    template<typename T>
    static void check_dups(const std::vector<T>& params) {
        std::set<size_t> types;
        bool first = true;
        size_t prev_idx = 0;
        for (const auto& p: params) {
            auto i = p.index();
            if (!first) {
                eosio::check(i > prev_idx, "parameters must be ordered by variant index");
            }
            eosio::check(types.count(i) == 0, "params contain several copies of the same parameter");
            types.emplace(i);
            prev_idx = i;
            first = false;
        }
    }

    template<typename V, typename T, typename Singleton>
    static V set_parameters(const std::vector<T>& params, Singleton& cfg, eosio::name payer) {
        const bool exists = cfg.exists();
        check_params(params, exists);

        V setter(exists ? cfg.get() : typename V::state_type{}, exists);
        bool changed = false;
        for (const auto& param: params) {
            changed |= std::visit(setter, param);
        }
        eosio::check(changed, "at least one parameter must change");
        cfg.set(setter.state, payer);
        return setter;
    }
};


} // alloc
