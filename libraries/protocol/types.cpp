#include <crowdmod/protocol/types.hpp>

namespace crowdmod { namespace protocol {

    std::string content_type_name(content_type type) {
        if (!is_valid_content_type(type)) {
            return std::to_string(uint32_t(type));
        }
        return fc::reflector<content_type>::to_string(type);
    }

    std::string content_id::to_string() const {
        return content_type_name(type) + "/" + std::to_string(index);
    }

} } // crowdmod::protocol
