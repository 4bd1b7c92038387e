#include <crowdmod/time/time.hpp>

namespace crowdmod {
    namespace time {

        static int64_t simulated_time = 0;
        static int64_t adjusted_time_sec = 0;

        fc::time_point now() {
            if (simulated_time) {
                return fc::time_point() +
                       fc::seconds(simulated_time + adjusted_time_sec);
            }

            return fc::time_point::now() + fc::seconds(adjusted_time_sec);
        }

        void start_simulated_time(const fc::time_point sim_time) {
            simulated_time = sim_time.sec_since_epoch();
            adjusted_time_sec = 0;
        }

        void advance_simulated_time_to(const fc::time_point sim_time) {
            simulated_time = sim_time.sec_since_epoch();
            adjusted_time_sec = 0;
        }

        void advance_time(int32_t delta_seconds) {
            adjusted_time_sec += delta_seconds;
        }

        void stop_simulated_time() {
            simulated_time = 0;
            adjusted_time_sec = 0;
        }

    }
} // crowdmod::time
