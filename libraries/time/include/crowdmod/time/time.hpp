#pragma once

#include <fc/time.hpp>

namespace crowdmod {
    namespace time {

        /// wall clock, or the simulated clock once start_simulated_time() was called
        fc::time_point now();

        void start_simulated_time(const fc::time_point sim_time);

        void advance_simulated_time_to(const fc::time_point sim_time);

        void advance_time(int32_t delta_seconds);

        void stop_simulated_time();

    }
} // crowdmod::time
