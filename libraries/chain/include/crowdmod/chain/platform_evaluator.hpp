#pragma once

#include <crowdmod/protocol/operations.hpp>
#include <crowdmod/chain/evaluator.hpp>

namespace crowdmod { namespace chain {
    using namespace crowdmod::protocol;

    DEFINE_EVALUATOR(upload)
    DEFINE_EVALUATOR(like)
    DEFINE_EVALUATOR(dislike)
    DEFINE_EVALUATOR(harvest_likes)
    DEFINE_EVALUATOR(deletion)
    DEFINE_EVALUATOR(voluntarily_delete)
    DEFINE_EVALUATOR(reply)
    DEFINE_EVALUATOR(withdraw)
    DEFINE_EVALUATOR(create_user)
    DEFINE_EVALUATOR(update_metadata)

} } // crowdmod::chain
