#include <boost/test/unit_test.hpp>

#include <crowdmod/chain/database.hpp>
#include <crowdmod/protocol/exceptions.hpp>

#include "database_fixture.hpp"
#include "helpers.hpp"

using namespace crowdmod;
using namespace crowdmod::chain;
using namespace crowdmod::protocol;
using std::string;


#define PERIOD CROWDMOD_MAU_PERIOD_SECONDS


BOOST_FIXTURE_TEST_SUITE(activity_tracker_tests, clean_database_fixture)

    BOOST_AUTO_TEST_CASE(default_profile) {
        try {
            BOOST_TEST_MESSAGE("Testing: default_profile");
            auto& activity = db->activity();

            auto profile = activity.profile("nobody");
            BOOST_CHECK_EQUAL(profile.latest_interaction, time_point_sec());
            BOOST_CHECK_EQUAL(profile.metadata_hash, digest_type());
            BOOST_CHECK_EQUAL(profile.user_name, account_name_type());
            BOOST_CHECK_EQUAL(profile.strikes, 0);

            BOOST_CHECK_EQUAL(activity.current_period_mau(), 0);
            BOOST_CHECK(activity.historic_mau().empty());
            BOOST_CHECK_EQUAL(activity.genesis(), genesis.genesis_time);
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(mau_lags_one_period) {
        try {
            BOOST_TEST_MESSAGE("Testing: mau_lags_one_period");
            auto& activity = db->activity();
            const auto g = genesis.genesis_time;

            BOOST_TEST_MESSAGE("--- bootstrap period is visible while open");
            activity.log_interaction("alice", g);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({1}));
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 1);

            activity.log_interaction("bob", g + 20);
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 2);

            BOOST_TEST_MESSAGE("--- repeated interactions are counted once");
            activity.log_interaction("alice", g + 30);
            activity.log_interaction("alice", g + PERIOD - 1);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({2}));
            BOOST_CHECK_EQUAL(activity.profile("alice").latest_interaction, g + PERIOD - 1);

            BOOST_TEST_MESSAGE("--- next period opens with the first interaction in it");
            activity.log_interaction("carol", g + PERIOD + 5);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({2, 1}));
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 2);

            BOOST_TEST_MESSAGE("--- open period does not move the current count");
            activity.log_interaction("alice", g + PERIOD + 6);
            activity.log_interaction("bob", g + PERIOD + 7);
            activity.log_interaction("dave", g + PERIOD + 8);
            activity.log_interaction("alice", g + PERIOD + 9);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({2, 4}));
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 2);

            BOOST_TEST_MESSAGE("--- closed period becomes current");
            activity.log_interaction("bob", g + 2 * PERIOD);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({2, 4, 1}));
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 4);
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(silent_periods_backfilled) {
        try {
            BOOST_TEST_MESSAGE("Testing: silent_periods_backfilled");
            auto& activity = db->activity();
            const auto g = genesis.genesis_time;

            BOOST_TEST_MESSAGE("--- first interaction after silent periods");
            activity.log_interaction("alice", g + 2 * PERIOD + 100);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({0, 0, 1}));
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 0);

            activity.log_interaction("bob", g + 2 * PERIOD + 200);
            activity.log_interaction("alice", g + 5 * PERIOD);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({0, 0, 2, 0, 0, 1}));
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 0);

            activity.log_interaction("bob", g + 6 * PERIOD);
            BOOST_CHECK_EQUAL(activity.current_period_mau(), 1);

            BOOST_TEST_MESSAGE("--- failed before genesis");
            CROWDMOD_CHECK_ERROR_PROPS(activity.log_interaction("carol", g - 1),
                CHECK_ERROR(invalid_value, 0));
            BOOST_CHECK_EQUAL(activity.profile("carol").latest_interaction, time_point_sec());
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(out_of_order_interactions) {
        try {
            BOOST_TEST_MESSAGE("Testing: out_of_order_interactions");
            auto& activity = db->activity();
            const auto g = genesis.genesis_time;

            activity.log_interaction("bob", g + 2 * PERIOD + 1);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({0, 0, 1}));

            BOOST_TEST_MESSAGE("--- failed in a closed period");
            CROWDMOD_CHECK_ERROR_PROPS(activity.log_interaction("bob", g + 10),
                CHECK_ERROR(invalid_value, 0));
            CROWDMOD_CHECK_ERROR_PROPS(activity.log_interaction("carol", g + PERIOD),
                CHECK_ERROR(invalid_value, 0));
            BOOST_CHECK_EQUAL(activity.profile("bob").latest_interaction, g + 2 * PERIOD + 1);

            BOOST_TEST_MESSAGE("--- failed before the latest interaction of the account");
            activity.log_interaction("alice", g + 2 * PERIOD + 50);
            CROWDMOD_CHECK_ERROR_PROPS(activity.log_interaction("alice", g + 2 * PERIOD + 40),
                CHECK_ERROR(invalid_value, 0));
            BOOST_CHECK_EQUAL(activity.profile("alice").latest_interaction, g + 2 * PERIOD + 50);

            BOOST_TEST_MESSAGE("--- each account still counts once per period");
            activity.log_interaction("bob", g + 2 * PERIOD + 2);
            activity.log_interaction("alice", g + 2 * PERIOD + 60);
            BOOST_CHECK_EQUAL(activity.historic_mau(), std::vector<uint64_t>({0, 0, 2}));
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(strikes) {
        try {
            BOOST_TEST_MESSAGE("Testing: strikes");
            auto& activity = db->activity();

            activity.add_strike("alice");
            activity.add_strike("alice");
            activity.add_strike("bob");

            BOOST_CHECK_EQUAL(activity.profile("alice").strikes, 2);
            BOOST_CHECK_EQUAL(activity.profile("bob").strikes, 1);
            BOOST_CHECK_EQUAL(activity.profile("bob").latest_interaction, time_point_sec());
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(username_registry) {
        try {
            BOOST_TEST_MESSAGE("Testing: username_registry");
            auto& activity = db->activity();

            BOOST_TEST_MESSAGE("--- success on a free valid name");
            activity.register_username("alice", "alice_1");
            BOOST_REQUIRE(activity.username_owner("alice_1").valid());
            BOOST_CHECK_EQUAL(*activity.username_owner("alice_1"), "alice");
            BOOST_CHECK_EQUAL(*activity.username_owner(string("alice_1") + string(8, '\0')), "alice");
            BOOST_CHECK_EQUAL(activity.profile("alice").user_name, "alice_1");

            BOOST_TEST_MESSAGE("--- failed when the account already has a name");
            CROWDMOD_CHECK_ERROR_PROPS(activity.register_username("alice", "other"),
                CHECK_ERROR(object_already_exist, "username", "alice_1"));

            BOOST_TEST_MESSAGE("--- failed when the name is taken");
            CROWDMOD_CHECK_ERROR_PROPS(activity.register_username("bob", "alice_1"),
                CHECK_ERROR(object_already_exist, "username", "alice_1"));
            BOOST_CHECK_EQUAL(activity.profile("bob").user_name, account_name_type());

            BOOST_TEST_MESSAGE("--- failed on invalid names");
            CROWDMOD_CHECK_ERROR_PROPS(activity.register_username("bob", "Bob1"),
                CHECK_ERROR(invalid_value, 0));
            CROWDMOD_CHECK_ERROR_PROPS(activity.register_username("bob", "bo"),
                CHECK_ERROR(invalid_value, 0));

            BOOST_TEST_MESSAGE("--- unknown and invalid names have no owner");
            BOOST_CHECK(!activity.username_owner("bob_2").valid());
            BOOST_CHECK(!activity.username_owner("AB").valid());
            BOOST_CHECK(!db->get_username_owner("").valid());
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(metadata) {
        try {
            BOOST_TEST_MESSAGE("Testing: metadata");
            auto& activity = db->activity();

            activity.set_metadata("alice", hash("one"));
            BOOST_CHECK_EQUAL(activity.profile("alice").metadata_hash, hash("one"));

            activity.set_metadata("alice", hash("two"));
            BOOST_CHECK_EQUAL(db->get_profile("alice").metadata_hash, hash("two"));

            BOOST_TEST_MESSAGE("--- zero hash clears it");
            activity.set_metadata("alice", digest_type());
            BOOST_CHECK_EQUAL(activity.profile("alice").metadata_hash, digest_type());
        }
        FC_LOG_AND_RETHROW()
    }

BOOST_AUTO_TEST_SUITE_END()
