#include <boost/test/included/unit_test.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

extern uint32_t CROWDMOD_TESTING_GENESIS_TIMESTAMP;

boost::unit_test::test_suite* init_unit_test_suite(int argc, char* argv[]) {
    const char* genesis_timestamp_str = getenv("CROWDMOD_TESTING_GENESIS_TIMESTAMP");
    if (genesis_timestamp_str != nullptr) {
        CROWDMOD_TESTING_GENESIS_TIMESTAMP = std::stoul(genesis_timestamp_str);
    }
    std::cout << "CROWDMOD_TESTING_GENESIS_TIMESTAMP is " << CROWDMOD_TESTING_GENESIS_TIMESTAMP << std::endl;
    return nullptr;
}
