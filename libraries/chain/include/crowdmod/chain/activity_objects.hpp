#pragma once

#include <crowdmod/chain/object_types.hpp>

namespace crowdmod { namespace chain {

    class profile_object final : public object<profile_object_type, profile_object> {
    public:
        template<typename Constructor, typename Allocator>
        profile_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        account_name_type account;
        time_point_sec latest_interaction; // == time_point_sec() means the account never interacted
        digest_type metadata_hash;
        account_name_type user_name;
        uint64_t strikes = 0;
    };

    /**
     * Claimed username. Both indices are unique, which makes the registry a bijection.
     */
    class username_object final : public object<username_object_type, username_object> {
    public:
        template<typename Constructor, typename Allocator>
        username_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        account_name_type name;
        account_name_type owner;
    };

    /**
     * Count of accounts seen in one 30-day period since genesis.
     */
    class mau_bucket_object final : public object<mau_bucket_object_type, mau_bucket_object> {
    public:
        template<typename Constructor, typename Allocator>
        mau_bucket_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        uint32_t period = 0;
        uint64_t active_users = 0;
    };

    struct by_account;
    struct by_name;
    struct by_owner;
    struct by_period;

    using profile_index = multi_index_container<
        profile_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<profile_object, profile_id_type, &profile_object::id>>,
            ordered_unique<
                tag<by_account>,
                member<profile_object, account_name_type, &profile_object::account>>>,
        allocator<profile_object>>;

    using username_index = multi_index_container<
        username_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<username_object, username_id_type, &username_object::id>>,
            ordered_unique<
                tag<by_name>,
                member<username_object, account_name_type, &username_object::name>>,
            ordered_unique<
                tag<by_owner>,
                member<username_object, account_name_type, &username_object::owner>>>,
        allocator<username_object>>;

    using mau_bucket_index = multi_index_container<
        mau_bucket_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<mau_bucket_object, mau_bucket_id_type, &mau_bucket_object::id>>,
            ordered_unique<
                tag<by_period>,
                member<mau_bucket_object, uint32_t, &mau_bucket_object::period>>>,
        allocator<mau_bucket_object>>;

} } // crowdmod::chain

FC_REFLECT((crowdmod::chain::profile_object),
    (id)(account)(latest_interaction)(metadata_hash)(user_name)(strikes))

FC_REFLECT((crowdmod::chain::username_object), (id)(name)(owner))

FC_REFLECT((crowdmod::chain::mau_bucket_object), (id)(period)(active_users))

CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::profile_object, crowdmod::chain::profile_index)
CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::username_object, crowdmod::chain::username_index)
CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::mau_bucket_object, crowdmod::chain::mau_bucket_index)
