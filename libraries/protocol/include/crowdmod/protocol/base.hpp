#pragma once

#include <crowdmod/protocol/types.hpp>

#include <fc/exception/exception.hpp>

namespace crowdmod { namespace protocol {

    struct base_operation {
        /// accounts whose identity the host runtime has to verify before the operation is applied
        void get_required_authorities(flat_set<account_name_type>&) const {
        }

        bool is_virtual() const {
            return false;
        }

        void validate() const {
        }
    };

    /**
     * Virtual operations are never submitted by users, the platform emits them as the
     * completion record of a workflow.
     */
    struct virtual_operation : public base_operation {
        bool is_virtual() const {
            return true;
        }

        void validate() const {
            FC_ASSERT(false, "This is a virtual operation");
        }
    };

} } // crowdmod::protocol
