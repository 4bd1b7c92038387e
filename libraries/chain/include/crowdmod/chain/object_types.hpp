#pragma once

#include <chainbase/chainbase.hpp>

#include <crowdmod/protocol/types.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace crowdmod { namespace chain {

    using namespace boost::multi_index;

    using boost::multi_index_container;

    using chainbase::object;
    using chainbase::object_id;
    using chainbase::allocator;

    using protocol::account_name_type;
    using protocol::content_id;
    using protocol::content_type;
    using protocol::digest_type;
    using protocol::token_amount_type;
    using fc::time_point_sec;

    struct by_id;

    enum object_type {
        platform_property_object_type,
        content_library_object_type,
        content_object_type,
        content_link_object_type,
        profile_object_type,
        username_object_type,
        mau_bucket_object_type,
        token_balance_object_type,
        token_allowance_object_type
    };

    class platform_property_object;
    class content_library_object;
    class content_object;
    class content_link_object;
    class profile_object;
    class username_object;
    class mau_bucket_object;
    class token_balance_object;
    class token_allowance_object;

    typedef object_id<platform_property_object> platform_property_id_type;
    typedef object_id<content_library_object> content_library_id_type;
    typedef object_id<content_object> content_object_id_type;
    typedef object_id<content_link_object> content_link_id_type;
    typedef object_id<profile_object> profile_id_type;
    typedef object_id<username_object> username_id_type;
    typedef object_id<mau_bucket_object> mau_bucket_id_type;
    typedef object_id<token_balance_object> token_balance_id_type;
    typedef object_id<token_allowance_object> token_allowance_id_type;

} } // crowdmod::chain

namespace fc {

    template<typename T>
    void to_variant(const chainbase::object_id<T>& var, fc::variant& vo) {
        vo = var._id;
    }

    template<typename T>
    void from_variant(const fc::variant& vo, chainbase::object_id<T>& var) {
        var._id = vo.as_int64();
    }

} // fc

FC_REFLECT_ENUM(crowdmod::chain::object_type,
    (platform_property_object_type)
    (content_library_object_type)
    (content_object_type)
    (content_link_object_type)
    (profile_object_type)
    (username_object_type)
    (mau_bucket_object_type)
    (token_balance_object_type)
    (token_allowance_object_type))
