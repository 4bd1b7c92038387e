#pragma once

#include <crowdmod/protocol/config.hpp>

#include <fc/container/flat.hpp>
#include <fc/exception/exception.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/fixed_string.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <fc/uint128.hpp>
#include <fc/variant.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <tuple>
#include <vector>

namespace crowdmod { namespace protocol {

    using std::string;
    using std::vector;
    using fc::flat_set;
    using fc::flat_map;
    using fc::optional;
    using fc::time_point_sec;

    using account_name_type = fc::fixed_string<fc::uint128_t>;
    using digest_type = fc::sha256;
    /// fixed point token amount, CROWDMOD_FIXED_POINT_SCALE units per token
    using token_amount_type = boost::multiprecision::uint256_t;

    /**
     * Every content record belongs to exactly one of these libraries. Each library is
     * an independent append-only collection with its own dense index space.
     */
    enum class content_type : uint8_t {
        post = 0,
        comment,
        article,
        image,
        video,
        audio,
        link,
        poll,
        question,
        answer,
        review,
        event,
        story,
        meme,
        live_stream
    };

    static_assert(uint8_t(content_type::live_stream) + 1 == CROWDMOD_CONTENT_TYPE_COUNT,
        "content_type must enumerate every library");

    inline bool is_valid_content_type(content_type type) {
        return uint8_t(type) < CROWDMOD_CONTENT_TYPE_COUNT;
    }

    std::string content_type_name(content_type type);

    /**
     * Permanent name of one content record: the library it lives in and its slot.
     * Never reused, even after the record is deleted.
     */
    struct content_id {
        content_id() = default;

        content_id(content_type t, uint64_t i)
                : type(t), index(i) {
        }

        content_type type = content_type::post;
        uint64_t index = 0;

        std::string to_string() const;

        friend bool operator==(const content_id& a, const content_id& b) {
            return a.type == b.type && a.index == b.index;
        }

        friend bool operator!=(const content_id& a, const content_id& b) {
            return !(a == b);
        }

        friend bool operator<(const content_id& a, const content_id& b) {
            return std::tie(a.type, a.index) < std::tie(b.type, b.index);
        }
    };

} } // crowdmod::protocol

namespace fc {

    // amounts do not fit a json number, they travel as decimal strings
    inline void to_variant(const crowdmod::protocol::token_amount_type& var, fc::variant& vo) {
        vo = var.str();
    }

    inline void from_variant(const fc::variant& var, crowdmod::protocol::token_amount_type& vo) {
        if (var.is_string()) {
            const auto& str = var.get_string();
            FC_ASSERT(!str.empty() && str.size() <= 78 &&
                str.find_first_not_of("0123456789") == std::string::npos,
                "Invalid token amount: ${str}", ("str", str));
            using boost::multiprecision::uint512_t;
            const uint512_t wide(str.c_str());
            FC_ASSERT(wide <= uint512_t(std::numeric_limits<crowdmod::protocol::token_amount_type>::max()),
                "Token amount ${str} is out of range", ("str", str));
            vo = static_cast<crowdmod::protocol::token_amount_type>(wide);
        } else {
            vo = var.as_uint64();
        }
    }

} // fc

FC_REFLECT_ENUM(crowdmod::protocol::content_type,
    (post)(comment)(article)(image)(video)(audio)(link)(poll)
    (question)(answer)(review)(event)(story)(meme)(live_stream))

FC_REFLECT((crowdmod::protocol::content_id), (type)(index))
