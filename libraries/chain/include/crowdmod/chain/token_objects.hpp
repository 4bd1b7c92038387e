#pragma once

#include <crowdmod/chain/object_types.hpp>

namespace crowdmod { namespace chain {

    class token_balance_object final : public object<token_balance_object_type, token_balance_object> {
    public:
        template<typename Constructor, typename Allocator>
        token_balance_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        account_name_type account;
        token_amount_type balance = 0;
    };

    class token_allowance_object final : public object<token_allowance_object_type, token_allowance_object> {
    public:
        template<typename Constructor, typename Allocator>
        token_allowance_object(Constructor&& c, allocator<Allocator> a) {
            c(*this);
        }

        id_type id;

        account_name_type owner;
        account_name_type spender;
        token_amount_type amount = 0;
    };

    struct by_account;
    struct by_owner_spender;

    using token_balance_index = multi_index_container<
        token_balance_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<token_balance_object, token_balance_id_type, &token_balance_object::id>>,
            ordered_unique<
                tag<by_account>,
                member<token_balance_object, account_name_type, &token_balance_object::account>>>,
        allocator<token_balance_object>>;

    using token_allowance_index = multi_index_container<
        token_allowance_object,
        indexed_by<
            ordered_unique<
                tag<by_id>,
                member<token_allowance_object, token_allowance_id_type, &token_allowance_object::id>>,
            ordered_unique<
                tag<by_owner_spender>,
                composite_key<
                    token_allowance_object,
                    member<token_allowance_object, account_name_type, &token_allowance_object::owner>,
                    member<token_allowance_object, account_name_type, &token_allowance_object::spender>>>>,
        allocator<token_allowance_object>>;

} } // crowdmod::chain

FC_REFLECT((crowdmod::chain::token_balance_object), (id)(account)(balance))
FC_REFLECT((crowdmod::chain::token_allowance_object), (id)(owner)(spender)(amount))

CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::token_balance_object, crowdmod::chain::token_balance_index)
CHAINBASE_SET_INDEX_TYPE(crowdmod::chain::token_allowance_object, crowdmod::chain::token_allowance_index)
