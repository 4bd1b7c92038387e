#pragma once

#include <crowdmod/chain/content_objects.hpp>

#include <vector>

namespace crowdmod { namespace chain {

    /**
     * Value form of one content slot, used to read and overwrite a record as a whole.
     */
    struct content_record {
        account_name_type owner;
        digest_type content_hash;
        digest_type metadata_hash;
        uint64_t likes = 0;
        uint64_t dislikes = 0;
        uint64_t harvested_likes = 0;
        std::vector<content_id> replies_to;
        std::vector<content_id> replied_by;
    };

    /**
     * Fifteen append-only collections of content, one per content_type, and the reply graph
     * between their records.
     *
     * A record exists iff its index is below the length of its collection. Indices are assigned
     * densely from zero and are never reused: remove() resets the slot instead of erasing it.
     */
    class content_ledger {
    public:
        explicit content_ledger(chainbase::database& db);

        /// creates the empty collections, called once on a fresh database
        void initialize();

        content_id create(const content_record& record, content_type type);

        content_record get(const content_id& id) const;

        /// overwrites the slot including its own reply lists
        void update(const content_id& id, const content_record& record);

        /// tombstones the slot; references held by other records stay valid
        void remove(const content_id& id);

        /// appends target to the replies_to list of reply and reply to the replied_by list of target
        void link(const content_id& reply, const content_id& target);

        std::vector<content_id> replies_of(const content_id& id) const;

        std::vector<content_id> replied_by_of(const content_id& id) const;

        uint64_t library_length(content_type type) const;

    private:
        const content_library_object& get_library(content_type type) const;

        const content_object& get_content(const content_id& id) const;

        std::vector<content_id> get_links(const content_id& id, link_direction direction) const;

        void replace_links(const content_id& id, link_direction direction, const std::vector<content_id>& links);

        void add_link(const content_id& id, link_direction direction, const content_id& other);

        chainbase::database& _db;
    };

} } // crowdmod::chain

FC_REFLECT((crowdmod::chain::content_record),
    (owner)(content_hash)(metadata_hash)(likes)(dislikes)(harvested_likes)(replies_to)(replied_by))
