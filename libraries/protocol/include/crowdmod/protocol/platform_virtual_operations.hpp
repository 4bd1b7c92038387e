#pragma once

#include <crowdmod/protocol/base.hpp>

namespace crowdmod { namespace protocol {

    struct uploaded_operation : public virtual_operation {
        uploaded_operation() {
        }

        uploaded_operation(const account_name_type& c, uint64_t i, content_type t)
                : creator(c), index(i), type(t) {
        }

        account_name_type creator;
        uint64_t index = 0;
        content_type type = content_type::post;
    };

    struct liked_operation : public virtual_operation {
        liked_operation() {
        }

        liked_operation(uint64_t i, content_type t)
                : index(i), type(t) {
        }

        uint64_t index = 0;
        content_type type = content_type::post;
    };

    struct disliked_operation : public virtual_operation {
        disliked_operation() {
        }

        disliked_operation(uint64_t i, content_type t)
                : index(i), type(t) {
        }

        uint64_t index = 0;
        content_type type = content_type::post;
    };

    struct harvested_operation : public virtual_operation {
        harvested_operation() {
        }

        harvested_operation(uint64_t i, content_type t, token_amount_type a)
                : index(i), type(t), amount(a) {
        }

        uint64_t index = 0;
        content_type type = content_type::post;
        token_amount_type amount = 0;
    };

    struct deleted_operation : public virtual_operation {
        deleted_operation() {
        }

        deleted_operation(const account_name_type& o, const digest_type& c, const digest_type& m,
                uint64_t i, content_type t)
                : owner(o), content_hash(c), metadata_hash(m), index(i), type(t) {
        }

        account_name_type owner;
        digest_type content_hash;
        digest_type metadata_hash;
        uint64_t index = 0;
        content_type type = content_type::post;
    };

    struct replied_operation : public virtual_operation {
        replied_operation() {
        }

        replied_operation(const content_id& reply, const content_id& target)
                : reply_index(reply.index), reply_type(reply.type),
                  target_index(target.index), target_type(target.type) {
        }

        uint64_t reply_index = 0;
        content_type reply_type = content_type::post;
        uint64_t target_index = 0;
        content_type target_type = content_type::post;
    };

} } // crowdmod::protocol

FC_REFLECT((crowdmod::protocol::uploaded_operation), (creator)(index)(type))
FC_REFLECT((crowdmod::protocol::liked_operation), (index)(type))
FC_REFLECT((crowdmod::protocol::disliked_operation), (index)(type))
FC_REFLECT((crowdmod::protocol::harvested_operation), (index)(type)(amount))
FC_REFLECT((crowdmod::protocol::deleted_operation), (owner)(content_hash)(metadata_hash)(index)(type))
FC_REFLECT((crowdmod::protocol::replied_operation), (reply_index)(reply_type)(target_index)(target_type))
