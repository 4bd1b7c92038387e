#pragma once

#include <crowdmod/protocol/operations.hpp>

namespace crowdmod { namespace chain {

    /**
     * Delivered after the workflow that produced the operation was committed.
     */
    struct operation_notification {
        operation_notification(const protocol::operation& o)
                : op(o) {
        }

        fc::time_point_sec timestamp;
        uint64_t sequence = 0;
        uint16_t virtual_op = 0;
        const protocol::operation& op;
    };

} } // crowdmod::chain
