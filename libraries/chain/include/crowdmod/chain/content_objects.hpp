#pragma once

#include <crowdmod/chain/object_types.hpp>

namespace crowdmod { namespace chain {

    /**
     * Length of one of the append-only content collections. There is exactly one per content type,
     * all of them are created when the database is initialized.
     */
    class content_library_object final : public object<content_library_object_type, content_library_object> {
    public:
        template<typename Constructor, typename Allocator>
        content_library_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        content_type type = content_type::post;
        uint64_t size = 0;
    };

    /**
     * One slot of a content collection. Deletion resets the payload but never removes the object,
     * so (type, index) stays allocated for the life of the database.
     */
    class content_object final : public object<content_object_type, content_object> {
    public:
        template<typename Constructor, typename Allocator>
        content_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        content_type type = content_type::post;
        uint64_t index = 0;

        account_name_type owner;
        digest_type content_hash;
        digest_type metadata_hash;

        uint64_t likes = 0;
        uint64_t dislikes = 0;
        uint64_t harvested_likes = 0;

        content_id get_content_id() const {
            return content_id{type, index};
        }
    };

    enum class link_direction : uint8_t {
        replies_to,
        replied_by
    };

    /**
     * One entry of a reply list. A link between two records is stored as a pair of objects, one
     * in the list of each side; insertion order is the order of ids.
     */
    class content_link_object final : public object<content_link_object_type, content_link_object> {
    public:
        template<typename Constructor, typename Allocator>
        content_link_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        content_id content;
        link_direction direction = link_direction::replies_to;
        content_id other;
    };

    struct by_type;
    struct by_content;
    struct by_content_direction;

    using content_library_index = multi_index_container<
        content_library_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<content_library_object, content_library_id_type, &content_library_object::id>>,
            ordered_unique<
                tag<by_type>,
                member<content_library_object, content_type, &content_library_object::type>>>,
        allocator<content_library_object>>;

    using content_index = multi_index_container<
        content_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<content_object, content_object_id_type, &content_object::id>>,
            ordered_unique<
                tag<by_content>,
                composite_key<
                    content_object,
                    member<content_object, content_type, &content_object::type>,
                    member<content_object, uint64_t, &content_object::index>>>>,
        allocator<content_object>>;

    using content_link_index = multi_index_container<
        content_link_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<content_link_object, content_link_id_type, &content_link_object::id>>,
            ordered_unique<
                tag<by_content_direction>,
                composite_key<
                    content_link_object,
                    member<content_link_object, content_id, &content_link_object::content>,
                    member<content_link_object, link_direction, &content_link_object::direction>,
                    member<content_link_object, content_link_id_type, &content_link_object::id>>>>,
        allocator<content_link_object>>;

} } // crowdmod::chain

FC_REFLECT_ENUM(crowdmod::chain::link_direction, (replies_to)(replied_by))

FC_REFLECT((crowdmod::chain::content_library_object), (id)(type)(size))

FC_REFLECT((crowdmod::chain::content_object),
    (id)(type)(index)(owner)(content_hash)(metadata_hash)(likes)(dislikes)(harvested_likes))

FC_REFLECT((crowdmod::chain::content_link_object), (id)(content)(direction)(other))

CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::content_library_object, crowdmod::chain::content_library_index)
CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::content_object, crowdmod::chain::content_index)
CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::content_link_object, crowdmod::chain::content_link_index)
