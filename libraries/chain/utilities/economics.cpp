#include <crowdmod/chain/utilities/economics.hpp>
#include <crowdmod/protocol/exceptions.hpp>

#include <limits>

namespace crowdmod { namespace chain { namespace utilities {

    namespace {
        uint256_t mau_squared(uint64_t mau) {
            CROWDMOD_ASSERT(mau != 0, division_by_zero,
                "Monthly active users count is zero", ("mau", mau));
            uint256_t m(mau);
            return m * m;
        }
    }

    token_amount_type reward(uint64_t mau) {
        const uint256_t amount = uint256_t(CROWDMOD_FIXED_POINT_SCALE) * CROWDMOD_BASE_REWARD;
        return amount / mau_squared(mau);
    }

    token_amount_type fee(uint64_t mau) {
        return uint256_t(CROWDMOD_COMMISSION_CONSTANT) / mau_squared(mau);
    }

    token_amount_type fee_for_strikes(uint64_t strikes, uint64_t mau) {
        CROWDMOD_CHECK_VALUE(strikes > 0, "Strike fee requires at least one strike", ("strikes", strikes));
        // fee(mau) is at most the commission constant, the product stays far below 2^256
        return uint256_t(CROWDMOD_STRIKE_FEE_MULTIPLIER) * fee(mau) * strikes;
    }

    token_amount_type reward_for_likes(uint64_t likes, uint64_t mau) {
        return uint256_t(likes) * reward(mau);
    }

    token_amount_type checked_add(token_amount_type a, token_amount_type b) {
        CROWDMOD_ASSERT(a <= std::numeric_limits<token_amount_type>::max() - b, arithmetic_overflow,
            "Sum of ${a} and ${b} does not fit a token amount", ("a", a)("b", b));
        return a + b;
    }

    bool should_eliminate(uint64_t likes, uint64_t dislikes) {
        const uint256_t total = uint256_t(likes) + dislikes;
        CROWDMOD_CHECK_LOGIC(total > CROWDMOD_MIN_VOTE_QUORUM,
            logic_exception::vote_quorum_not_met,
            "Elimination needs more than ${quorum} votes",
            ("quorum", CROWDMOD_MIN_VOTE_QUORUM)("likes", likes)("dislikes", dislikes));

        if (dislikes == 0) {
            return false;
        }

        const uint256_t scale(CROWDMOD_FIXED_POINT_SCALE);
        const uint256_t share = uint256_t(dislikes) * scale / total;
        const uint256_t variance = share * (scale - share) / scale / total;
        const uint256_t margin = boost::multiprecision::sqrt(variance) * CROWDMOD_WILSON_Z_SCORE
            / CROWDMOD_FIXED_POINT_SQRT_SCALE;

        // share <= SCALE and margin < SCALE, both fit 64 bits
        const uint64_t p = static_cast<uint64_t>(share);
        const uint64_t m = static_cast<uint64_t>(margin);

        // modular subtraction, a result above the minuend means the margin exceeded the share
        const uint64_t lower = p - m;
        if (lower > p) {
            return false;
        }

        return lower > CROWDMOD_ELIMINATION_THRESHOLD;
    }

} } } // crowdmod::chain::utilities
