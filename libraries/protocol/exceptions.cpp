#include <crowdmod/protocol/exceptions.hpp>

namespace crowdmod {

template<>
std::string get_logic_error_namespace<crowdmod::logic_exception::error_types>() {
    return "crowdmod";
}

} // crowdmod
