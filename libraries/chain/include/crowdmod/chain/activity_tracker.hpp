#pragma once

#include <crowdmod/chain/activity_objects.hpp>

#include <fc/optional.hpp>

#include <vector>

namespace crowdmod { namespace chain {

    using protocol::string;

    struct user_profile {
        time_point_sec latest_interaction;
        digest_type metadata_hash;
        account_name_type user_name;
        uint64_t strikes = 0;
    };

    /**
     * User profiles, the username registry and the monthly active users histogram.
     *
     * The histogram has one bucket per 30-day period since genesis. An account is counted at most
     * once per period: it is counted when its previous interaction happened before the start of the
     * open period, so no per-period set of accounts has to be kept.
     */
    class activity_tracker {
    public:
        activity_tracker(chainbase::database& db, const time_point_sec& genesis);

        /// default profile if the account never interacted
        user_profile profile(const account_name_type& account) const;

        /**
         * Count of the last closed period. While only the bootstrap period exists its open count is
         * returned, and 0 before any interaction.
         */
        uint64_t current_period_mau() const;

        std::vector<uint64_t> historic_mau() const;

        void log_interaction(const account_name_type& account, const time_point_sec& now);

        void add_strike(const account_name_type& account);

        void register_username(const account_name_type& account, const string& name);

        void set_metadata(const account_name_type& account, const digest_type& metadata_hash);

        fc::optional<account_name_type> username_owner(const string& name) const;

        const time_point_sec& genesis() const {
            return _genesis;
        }

    private:
        const profile_object& get_or_create_profile(const account_name_type& account);

        uint32_t histogram_length() const;

        void push_bucket(uint64_t active_users);

        chainbase::database& _db;
        time_point_sec _genesis;
    };

} } // crowdmod::chain

FC_REFLECT((crowdmod::chain::user_profile), (latest_interaction)(metadata_hash)(user_name)(strikes))
