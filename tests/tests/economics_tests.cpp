#include <boost/test/unit_test.hpp>

#include <crowdmod/chain/utilities/economics.hpp>
#include <crowdmod/protocol/exceptions.hpp>

#include "database_fixture.hpp"
#include "helpers.hpp"

#include <limits>

using namespace crowdmod;
using namespace crowdmod::chain;
using namespace crowdmod::chain::utilities;
using std::string;


BOOST_AUTO_TEST_SUITE(economics_tests)

    BOOST_AUTO_TEST_CASE(reward_and_fee) {
        try {
            BOOST_TEST_MESSAGE("Testing: reward_and_fee");

            BOOST_TEST_MESSAGE("--- reward shrinks with the square of active users");
            BOOST_CHECK_EQUAL(reward(1), 10 * CROWDMOD_FIXED_POINT_SCALE);
            BOOST_CHECK_EQUAL(reward(10), CROWDMOD_FIXED_POINT_SCALE / 10);
            BOOST_CHECK_EQUAL(reward(7), 204081632653061224ull);

            BOOST_TEST_MESSAGE("--- fee is the commission constant over mau^2");
            BOOST_CHECK_EQUAL(fee(1), CROWDMOD_COMMISSION_CONSTANT);
            BOOST_CHECK_EQUAL(fee(10), 5000000000000000ull);
            BOOST_CHECK_EQUAL(fee(100), 50000000000000ull);

            BOOST_TEST_MESSAGE("--- tiny amounts round down to zero");
            BOOST_CHECK_EQUAL(fee(std::numeric_limits<uint64_t>::max()), 0);

            BOOST_TEST_MESSAGE("--- failed when mau is zero");
            CROWDMOD_CHECK_ERROR_PROPS(reward(0), CHECK_ERROR(division_by_zero, 0));
            CROWDMOD_CHECK_ERROR_PROPS(fee(0), CHECK_ERROR(division_by_zero, 0));
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(strike_fee) {
        try {
            BOOST_TEST_MESSAGE("Testing: strike_fee");

            BOOST_CHECK_EQUAL(fee_for_strikes(2, 100), 3 * fee(100) * 2);
            BOOST_CHECK_EQUAL(fee_for_strikes(1, 10), 15000000000000000ull);

            BOOST_TEST_MESSAGE("--- large strike counts at a single active user");
            BOOST_CHECK_EQUAL(fee_for_strikes(100, 1), token_amount_type(150) * CROWDMOD_FIXED_POINT_SCALE);

            BOOST_TEST_MESSAGE("--- failed without strikes");
            CROWDMOD_CHECK_ERROR_PROPS(fee_for_strikes(0, 100), CHECK_ERROR(invalid_value, 0));
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(checked_amounts) {
        try {
            BOOST_TEST_MESSAGE("Testing: checked_amounts");
            const auto max = std::numeric_limits<token_amount_type>::max();

            BOOST_CHECK_EQUAL(reward_for_likes(4, 7), 4 * reward(7));
            BOOST_CHECK_EQUAL(reward_for_likes(0, 7), 0);
            BOOST_CHECK_EQUAL(checked_add(max - 1, 1), max);

            BOOST_TEST_MESSAGE("--- amounts above 2^64 are representable");
            BOOST_CHECK_EQUAL(reward_for_likes(2, 1), token_amount_type(20) * CROWDMOD_FIXED_POINT_SCALE);
            const auto huge = reward_for_likes(std::numeric_limits<uint64_t>::max(), 1);
            BOOST_CHECK_EQUAL(huge, token_amount_type(std::numeric_limits<uint64_t>::max()) * reward(1));

            token_amount_type minted = 0;
            for (int i = 0; i < 30; ++i) {
                minted = checked_add(minted, reward_for_likes(4, 7));
            }
            BOOST_CHECK_EQUAL(minted, 120 * reward(7));
            BOOST_CHECK(minted > token_amount_type(std::numeric_limits<uint64_t>::max()));

            BOOST_TEST_MESSAGE("--- failed when the sum does not fit");
            CROWDMOD_CHECK_ERROR_PROPS(checked_add(max, 1), CHECK_ERROR(arithmetic_overflow, 0));
            CROWDMOD_CHECK_ERROR_PROPS(checked_add(max / 2 + 1, max / 2 + 1), CHECK_ERROR(arithmetic_overflow, 0));
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(elimination) {
        try {
            BOOST_TEST_MESSAGE("Testing: elimination");

            BOOST_TEST_MESSAGE("--- no dislikes never eliminates");
            BOOST_CHECK(!should_eliminate(10, 0));

            BOOST_TEST_MESSAGE("--- dominant disapproval eliminates");
            BOOST_CHECK(should_eliminate(1, 9));
            BOOST_CHECK(should_eliminate(0, 6));
            BOOST_CHECK(should_eliminate(2, 8));

            BOOST_TEST_MESSAGE("--- borderline votes are not conclusive");
            BOOST_CHECK(!should_eliminate(3, 3));
            BOOST_CHECK(!should_eliminate(4, 6));

            BOOST_TEST_MESSAGE("--- margin above the dislike share is treated as a zero lower bound");
            BOOST_CHECK(!should_eliminate(10, 2));

            BOOST_TEST_MESSAGE("--- failed without quorum");
            CROWDMOD_CHECK_ERROR_PROPS(should_eliminate(0, 5),
                CHECK_ERROR(logic_exception, logic_exception::vote_quorum_not_met));
            CROWDMOD_CHECK_ERROR_PROPS(should_eliminate(3, 2),
                CHECK_ERROR(logic_exception, logic_exception::vote_quorum_not_met));
            CROWDMOD_CHECK_ERROR_PROPS(should_eliminate(0, 0),
                CHECK_ERROR(logic_exception, logic_exception::vote_quorum_not_met));

            BOOST_TEST_MESSAGE("--- vote counts near the integer limit");
            const auto max = std::numeric_limits<uint64_t>::max();
            BOOST_CHECK(!should_eliminate(max, 1));
            BOOST_CHECK(should_eliminate(0, max));
        }
        FC_LOG_AND_RETHROW()
    }

    BOOST_AUTO_TEST_CASE(username_rules) {
        try {
            BOOST_TEST_MESSAGE("Testing: username_rules");

            BOOST_CHECK(is_valid_username("ab_1"));
            BOOST_CHECK(is_valid_username(string("ab_1") + string(11, '\0')));
            BOOST_CHECK(is_valid_username("abcdefghijklmn5"));
            BOOST_CHECK(is_valid_username("____"));

            BOOST_CHECK(!is_valid_username(""));
            BOOST_CHECK(!is_valid_username(string(15, '\0')));
            BOOST_CHECK(!is_valid_username("ab1"));
            BOOST_CHECK(!is_valid_username(string("ab\0cd", 5)));
            BOOST_CHECK(!is_valid_username("AB12"));
            BOOST_CHECK(!is_valid_username("ab-12"));
            BOOST_CHECK(!is_valid_username("abcdefghijklmnop"));

            CROWDMOD_CHECK_ERROR_PROPS(validate_username("ab1"), CHECK_ERROR(invalid_value, 0));
            BOOST_CHECK_NO_THROW(validate_username("ab_1"));
        }
        FC_LOG_AND_RETHROW()
    }

BOOST_AUTO_TEST_SUITE_END()
