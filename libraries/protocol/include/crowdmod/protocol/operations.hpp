#pragma once

#include <crowdmod/protocol/platform_operations.hpp>
#include <crowdmod/protocol/platform_virtual_operations.hpp>

#include <fc/static_variant.hpp>

namespace crowdmod { namespace protocol {

    /** NOTE: the position of an operation in this variant is part of its serialized
     * form, append new operations only.
     */
    typedef fc::static_variant<
            upload_operation,
            like_operation,
            dislike_operation,
            harvest_likes_operation,
            deletion_operation,
            voluntarily_delete_operation,
            reply_operation,
            withdraw_operation,
            create_user_operation,
            update_metadata_operation,

            /// virtual operations below this point
            uploaded_operation,
            liked_operation,
            disliked_operation,
            harvested_operation,
            deleted_operation,
            replied_operation
    > operation;

    bool is_virtual_operation(const operation& op);

    void operation_validate(const operation& op);

    void operation_get_required_authorities(const operation& op, flat_set<account_name_type>& authorities);

    std::string operation_name(const operation& op);

} } // crowdmod::protocol

namespace fc {

    void to_variant(const crowdmod::protocol::operation& var, fc::variant& vo);

    void from_variant(const fc::variant& var, crowdmod::protocol::operation& vo);

} // fc

FC_REFLECT_TYPENAME((crowdmod::protocol::operation))
