#pragma once

#include <crowdmod/chain/object_types.hpp>

namespace crowdmod { namespace chain {

    /**
     * Singleton with the network configuration fixed at initialization and the running totals of
     * token flows through the platform.
     */
    class platform_property_object final : public object<platform_property_object_type, platform_property_object> {
    public:
        template<typename Constructor, typename Allocator>
        platform_property_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        time_point_sec genesis_time;
        account_name_type administrator;
        account_name_type platform_account;
        /// operations are applied in non-decreasing time order
        time_point_sec last_operation_time;

        token_amount_type collected_fees = 0;
        token_amount_type minted_rewards = 0;
        token_amount_type withdrawn_fees = 0;
    };

    using platform_property_index = multi_index_container<
        platform_property_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<platform_property_object, platform_property_id_type, &platform_property_object::id>>>,
        allocator<platform_property_object>>;

} } // crowdmod::chain

FC_REFLECT((crowdmod::chain::platform_property_object),
    (id)(genesis_time)(administrator)(platform_account)(last_operation_time)(collected_fees)(minted_rewards)(withdrawn_fees))

CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::platform_property_object, crowdmod::chain::platform_property_index)
