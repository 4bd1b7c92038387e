#include <crowdmod/chain/content_ledger.hpp>
#include <crowdmod/protocol/exceptions.hpp>

#include <limits>

namespace crowdmod { namespace chain {

    content_ledger::content_ledger(chainbase::database& db)
            : _db(db) {
    }

    void content_ledger::initialize() {
        for (uint8_t i = 0; i < CROWDMOD_CONTENT_TYPE_COUNT; i++) {
            _db.create<content_library_object>([&](content_library_object& l) {
                l.type = static_cast<content_type>(i);
                l.size = 0;
            });
        }
    }

    const content_library_object& content_ledger::get_library(content_type type) const {
        const auto& idx = _db.get_index<content_library_index>().indices().get<by_type>();
        auto itr = idx.find(type);
        if (itr == idx.end()) {
            CROWDMOD_THROW_MISSING_OBJECT("content_library", static_cast<uint32_t>(type));
        }
        return *itr;
    }

    const content_object& content_ledger::get_content(const content_id& id) const {
        const auto& library = get_library(id.type);
        if (id.index >= library.size) {
            CROWDMOD_THROW_MISSING_OBJECT("content", id.to_string(), ("length", library.size));
        }

        const auto& idx = _db.get_index<content_index>().indices().get<by_content>();
        auto itr = idx.find(std::make_tuple(id.type, id.index));
        if (itr == idx.end()) {
            CROWDMOD_THROW_INTERNAL_ERROR("Content ${id} is within its collection but has no slot", ("id", id));
        }
        return *itr;
    }

    content_id content_ledger::create(const content_record& record, content_type type) {
        const auto& library = get_library(type);
        if (library.size == std::numeric_limits<uint64_t>::max()) {
            CROWDMOD_THROW_INTERNAL_ERROR("Collection ${type} is full", ("type", type));
        }

        const content_id id{type, library.size};
        _db.create<content_object>([&](content_object& c) {
            c.type = id.type;
            c.index = id.index;
            c.owner = record.owner;
            c.content_hash = record.content_hash;
            c.metadata_hash = record.metadata_hash;
            c.likes = record.likes;
            c.dislikes = record.dislikes;
            c.harvested_likes = record.harvested_likes;
        });
        _db.modify(library, [&](content_library_object& l) {
            l.size++;
        });

        for (const auto& other : record.replies_to) {
            add_link(id, link_direction::replies_to, other);
        }
        for (const auto& other : record.replied_by) {
            add_link(id, link_direction::replied_by, other);
        }
        return id;
    }

    content_record content_ledger::get(const content_id& id) const {
        const auto& c = get_content(id);

        content_record result;
        result.owner = c.owner;
        result.content_hash = c.content_hash;
        result.metadata_hash = c.metadata_hash;
        result.likes = c.likes;
        result.dislikes = c.dislikes;
        result.harvested_likes = c.harvested_likes;
        result.replies_to = get_links(id, link_direction::replies_to);
        result.replied_by = get_links(id, link_direction::replied_by);
        return result;
    }

    void content_ledger::update(const content_id& id, const content_record& record) {
        const auto& c = get_content(id);
        _db.modify(c, [&](content_object& o) {
            o.owner = record.owner;
            o.content_hash = record.content_hash;
            o.metadata_hash = record.metadata_hash;
            o.likes = record.likes;
            o.dislikes = record.dislikes;
            o.harvested_likes = record.harvested_likes;
        });

        replace_links(id, link_direction::replies_to, record.replies_to);
        replace_links(id, link_direction::replied_by, record.replied_by);
    }

    void content_ledger::remove(const content_id& id) {
        update(id, content_record());
    }

    void content_ledger::link(const content_id& reply, const content_id& target) {
        get_content(reply);
        get_content(target);

        add_link(reply, link_direction::replies_to, target);
        add_link(target, link_direction::replied_by, reply);
    }

    std::vector<content_id> content_ledger::replies_of(const content_id& id) const {
        get_content(id);
        return get_links(id, link_direction::replies_to);
    }

    std::vector<content_id> content_ledger::replied_by_of(const content_id& id) const {
        get_content(id);
        return get_links(id, link_direction::replied_by);
    }

    uint64_t content_ledger::library_length(content_type type) const {
        return get_library(type).size;
    }

    std::vector<content_id> content_ledger::get_links(const content_id& id, link_direction direction) const {
        std::vector<content_id> result;

        const auto& idx = _db.get_index<content_link_index>().indices().get<by_content_direction>();
        auto range = idx.equal_range(std::make_tuple(id, direction));
        for (auto itr = range.first; itr != range.second; ++itr) {
            result.push_back(itr->other);
        }
        return result;
    }

    void content_ledger::replace_links(
        const content_id& id, link_direction direction, const std::vector<content_id>& links
    ) {
        if (get_links(id, direction) == links) {
            return;
        }

        const auto& idx = _db.get_index<content_link_index>().indices().get<by_content_direction>();
        auto itr = idx.lower_bound(std::make_tuple(id, direction));
        while (itr != idx.end() && itr->content == id && itr->direction == direction) {
            const auto& link = *itr;
            ++itr;
            _db.remove(link);
        }

        for (const auto& other : links) {
            add_link(id, direction, other);
        }
    }

    void content_ledger::add_link(const content_id& id, link_direction direction, const content_id& other) {
        _db.create<content_link_object>([&](content_link_object& l) {
            l.content = id;
            l.direction = direction;
            l.other = other;
        });
    }

} } // crowdmod::chain
