#include "alloc_tester.hpp"
#include "alloc.access_test_api.hpp"
#include "contracts.hpp"

namespace cfg = alloc::config;
using namespace eosio::testing;
using namespace eosio::chain;
using namespace fc;

class alloc_access_tester : public alloc_tester {
protected:
    alloc_access_api access;

public:
    alloc_access_tester()
        : alloc_tester(cfg::access_name)
        , access({this, _code})
    {
        create_accounts({_code, _admin, _script, _alice, cfg::vesting_name, cfg::pool_name});
        produce_block();
        access.initialize_contract();
    }

    const name _admin = N(admin);
    const name _script = N(script);
    const name _alice = N(alice);

    struct errors: contract_error_messages {
        const string unknown_role       = amsg("unknown role");
        const string no_account         = amsg("account does not exist");
        const string owner_role         = amsg("owner already holds every role");
        const string already_granted    = amsg("role already granted");
        const string not_granted        = amsg("role is not granted");
        const string not_admin          = amsg("caller is not an admin");
        const string already_paused     = amsg("already paused");
        const string not_paused         = amsg("not paused");
    } err;
};


BOOST_AUTO_TEST_SUITE(alloc_access_tests)

BOOST_FIXTURE_TEST_CASE(add_remove_role, alloc_access_tester) try {
    BOOST_TEST_MESSAGE("Role registry");

    BOOST_TEST_MESSAGE("--- only owner can grant roles");
    BOOST_CHECK_EQUAL(err.missing_auth(_code),
        push_action_msig_tx(_code, N(addrole), {{_admin, config::active_name}}, {_admin},
            mvo()("account", _alice)("role", cfg::admin_role)));

    BOOST_TEST_MESSAGE("--- validation");
    BOOST_CHECK_EQUAL(err.unknown_role, access.add_role(_alice, N(superuser)));
    BOOST_CHECK_EQUAL(err.no_account, access.add_role(N(nobody), cfg::admin_role));
    BOOST_CHECK_EQUAL(err.owner_role, access.add_role(_code, cfg::admin_role));

    BOOST_TEST_MESSAGE("--- grant admin, script and approved");
    BOOST_CHECK(access.get_role(cfg::admin_role, _admin).is_null());
    BOOST_CHECK_EQUAL(success(), access.add_role(_admin, cfg::admin_role));
    BOOST_CHECK_EQUAL(success(), access.add_role(_script, cfg::script_role));
    BOOST_CHECK_EQUAL(success(), access.add_role(cfg::vesting_name, cfg::approved_role));
    BOOST_CHECK_EQUAL(success(), access.add_role(cfg::pool_name, cfg::distributor_role));
    CHECK_MATCHING_OBJECT(access.get_role(cfg::admin_role, _admin), mvo()("account", _admin));
    CHECK_MATCHING_OBJECT(access.get_role(cfg::approved_role, cfg::vesting_name), mvo()("account", cfg::vesting_name));
    BOOST_CHECK(access.get_role(cfg::script_role, _admin).is_null());

    BOOST_CHECK_EQUAL(err.already_granted, access.add_role(_admin, cfg::admin_role));

    BOOST_TEST_MESSAGE("--- revoke");
    BOOST_CHECK_EQUAL(success(), access.remove_role(_admin, cfg::admin_role));
    BOOST_CHECK(access.get_role(cfg::admin_role, _admin).is_null());
    BOOST_CHECK_EQUAL(err.not_granted, access.remove_role(_admin, cfg::admin_role));
    BOOST_CHECK_EQUAL(err.unknown_role, access.remove_role(_admin, N(superuser)));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(pause_unpause, alloc_access_tester) try {
    BOOST_TEST_MESSAGE("Global pause flag");
    BOOST_CHECK_EQUAL(success(), access.add_role(_admin, cfg::admin_role));
    BOOST_CHECK(!access.is_paused());

    BOOST_TEST_MESSAGE("--- only admins can pause");
    BOOST_CHECK_EQUAL(err.not_admin, access.pause(_alice));
    BOOST_CHECK_EQUAL(err.not_admin, access.pause(_script));

    BOOST_CHECK_EQUAL(err.not_paused, access.unpause(_admin));
    BOOST_CHECK_EQUAL(success(), access.pause(_admin));
    BOOST_CHECK(access.is_paused());
    BOOST_CHECK_EQUAL(err.already_paused, access.pause(_admin));

    BOOST_CHECK_EQUAL(err.not_admin, access.unpause(_alice));
    BOOST_CHECK_EQUAL(success(), access.unpause(_admin));
    BOOST_CHECK(!access.is_paused());

    BOOST_TEST_MESSAGE("--- owner holds admin role implicitly");
    BOOST_CHECK_EQUAL(success(), access.pause(_code));
    BOOST_CHECK(access.is_paused());

    BOOST_TEST_MESSAGE("--- removed admin loses the ability");
    BOOST_CHECK_EQUAL(success(), access.remove_role(_admin, cfg::admin_role));
    BOOST_CHECK_EQUAL(err.not_admin, access.unpause(_admin));
    BOOST_CHECK(access.is_paused());
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
