#pragma once

#include <crowdmod/protocol/config.hpp>
#include <crowdmod/protocol/types.hpp>
#include <crowdmod/protocol/username.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace crowdmod { namespace chain { namespace utilities {

    using protocol::token_amount_type;
    using protocol::is_valid_username;
    using protocol::validate_username;

    using boost::multiprecision::uint256_t;

    /**
     * Amount minted per harvested like: SCALE * BASE_REWARD / mau^2.
     * Throws division_by_zero when @p mau is zero.
     */
    token_amount_type reward(uint64_t mau);

    /**
     * Fee for a vote: COMMISSION_CONSTANT / mau^2.
     * Throws division_by_zero when @p mau is zero.
     */
    token_amount_type fee(uint64_t mau);

    /// 3 * fee(mau) * strikes, strikes must be positive
    token_amount_type fee_for_strikes(uint64_t strikes, uint64_t mau);

    /// likes * reward(mau)
    token_amount_type reward_for_likes(uint64_t likes, uint64_t mau);

    /// a + b, throws arithmetic_overflow instead of wrapping
    token_amount_type checked_add(token_amount_type a, token_amount_type b);

    /**
     * Lower bound of the Wilson score interval of the dislike share, compared against one half.
     * Throws logic_exception (vote_quorum_not_met) unless likes + dislikes exceeds
     * CROWDMOD_MIN_VOTE_QUORUM.
     */
    bool should_eliminate(uint64_t likes, uint64_t dislikes);

} } } // crowdmod::chain::utilities
