#pragma once

#define CROWDMOD_VERSION_STRING                  "0.1.0"

#define CROWDMOD_FIXED_POINT_SCALE               (uint64_t(1000000000000000000ull)) // 10^18
#define CROWDMOD_FIXED_POINT_SQRT_SCALE          (uint64_t(1000000000ull))          // 10^9

/// reward paid per harvested like when the platform has one active user, in whole tokens
#define CROWDMOD_BASE_REWARD                     (uint64_t(10))
#define CROWDMOD_COMMISSION_PERCENT              (uint64_t(5))
#define CROWDMOD_100_PERCENT                     (uint64_t(100))
/// SCALE * BASE_REWARD * COMMISSION_PERCENT / 100, divided first to stay within 64 bits
#define CROWDMOD_COMMISSION_CONSTANT \
    (CROWDMOD_FIXED_POINT_SCALE / CROWDMOD_100_PERCENT * CROWDMOD_BASE_REWARD * CROWDMOD_COMMISSION_PERCENT)
#define CROWDMOD_STRIKE_FEE_MULTIPLIER           (uint64_t(3))

#define CROWDMOD_MIN_VOTE_QUORUM                 (uint64_t(5))
/// 1.96 scaled by 10^18, two-sided 95% confidence
#define CROWDMOD_WILSON_Z_SCORE                  (uint64_t(1960000000000000000ull))
#define CROWDMOD_ELIMINATION_THRESHOLD           (uint64_t(500000000000000000ull))  // 0.5

#define CROWDMOD_MAU_PERIOD_SECONDS              (60*60*24*30)

#define CROWDMOD_CONTENT_TYPE_COUNT              15

#define CROWDMOD_USERNAME_LENGTH                 15
#define CROWDMOD_MIN_USERNAME_LENGTH             4
#define CROWDMOD_MIN_ACCOUNT_NAME_LENGTH         1
#define CROWDMOD_MAX_ACCOUNT_NAME_LENGTH         16

#define CROWDMOD_DEFAULT_PLATFORM_ACCOUNT        "crowdmod"
#define CROWDMOD_DEFAULT_ADMINISTRATOR           "admin"
