#include <crowdmod/chain/activity_tracker.hpp>
#include <crowdmod/protocol/exceptions.hpp>
#include <crowdmod/protocol/username.hpp>

namespace crowdmod { namespace chain {

    activity_tracker::activity_tracker(chainbase::database& db, const time_point_sec& genesis)
            : _db(db), _genesis(genesis) {
    }

    user_profile activity_tracker::profile(const account_name_type& account) const {
        user_profile result;

        const auto* p = _db.find<profile_object, by_account>(account);
        if (p != nullptr) {
            result.latest_interaction = p->latest_interaction;
            result.metadata_hash = p->metadata_hash;
            result.user_name = p->user_name;
            result.strikes = p->strikes;
        }
        return result;
    }

    const profile_object& activity_tracker::get_or_create_profile(const account_name_type& account) {
        const auto* p = _db.find<profile_object, by_account>(account);
        if (p != nullptr) {
            return *p;
        }
        return _db.create<profile_object>([&](profile_object& o) {
            o.account = account;
        });
    }

    uint32_t activity_tracker::histogram_length() const {
        const auto& idx = _db.get_index<mau_bucket_index>().indices().get<by_period>();
        if (idx.empty()) {
            return 0;
        }
        return idx.rbegin()->period + 1;
    }

    void activity_tracker::push_bucket(uint64_t active_users) {
        const auto period = histogram_length();
        _db.create<mau_bucket_object>([&](mau_bucket_object& b) {
            b.period = period;
            b.active_users = active_users;
        });
    }

    uint64_t activity_tracker::current_period_mau() const {
        const auto& idx = _db.get_index<mau_bucket_index>().indices().get<by_period>();
        if (idx.empty()) {
            return 0;
        }

        auto itr = idx.rbegin();
        if (itr->period > 0) {
            ++itr;
        }
        return itr->active_users;
    }

    std::vector<uint64_t> activity_tracker::historic_mau() const {
        std::vector<uint64_t> result;

        const auto& idx = _db.get_index<mau_bucket_index>().indices().get<by_period>();
        for (const auto& bucket : idx) {
            result.push_back(bucket.active_users);
        }
        return result;
    }

    void activity_tracker::log_interaction(const account_name_type& account, const time_point_sec& now) {
        CROWDMOD_CHECK_VALUE(now >= _genesis, "Interaction at ${now} precedes genesis ${genesis}",
            ("now", now)("genesis", _genesis)("account", account));

        const uint64_t elapsed = (now.sec_since_epoch() - _genesis.sec_since_epoch()) / CROWDMOD_MAU_PERIOD_SECONDS;

        uint64_t length = histogram_length();
        CROWDMOD_CHECK_VALUE(elapsed + 1 >= length, "Interaction at ${now} precedes the open period ${period}",
            ("now", now)("period", length - 1)("account", account));
        for (; length < elapsed; length++) {
            push_bucket(0);
        }

        const auto& p = get_or_create_profile(account);
        CROWDMOD_CHECK_VALUE(p.latest_interaction <= now,
            "Interaction at ${now} precedes the latest one of ${account} at ${latest}",
            ("now", now)("latest", p.latest_interaction)("account", account));

        if (elapsed + 1 > length) {
            push_bucket(1);
        } else {
            const int64_t open_period_start = int64_t(_genesis.sec_since_epoch()) +
                int64_t(CROWDMOD_MAU_PERIOD_SECONDS) * int64_t(length - 1);

            if (p.latest_interaction == time_point_sec() ||
                int64_t(p.latest_interaction.sec_since_epoch()) < open_period_start
            ) {
                const auto& idx = _db.get_index<mau_bucket_index>().indices().get<by_period>();
                _db.modify(*idx.rbegin(), [&](mau_bucket_object& b) {
                    b.active_users++;
                });
            }
        }

        _db.modify(p, [&](profile_object& o) {
            o.latest_interaction = now;
        });
    }

    void activity_tracker::add_strike(const account_name_type& account) {
        _db.modify(get_or_create_profile(account), [&](profile_object& o) {
            o.strikes++;
        });
    }

    void activity_tracker::register_username(const account_name_type& account, const string& name) {
        protocol::validate_username(name);
        const account_name_type user_name(protocol::trim_username(name));

        const auto* existing = _db.find<username_object, by_owner>(account);
        if (existing != nullptr) {
            CROWDMOD_THROW_OBJECT_ALREADY_EXIST("username", string(existing->name), ("account", account));
        }
        if (_db.find<username_object, by_name>(user_name) != nullptr) {
            CROWDMOD_THROW_OBJECT_ALREADY_EXIST("username", string(user_name), ("account", account));
        }

        _db.create<username_object>([&](username_object& u) {
            u.name = user_name;
            u.owner = account;
        });
        _db.modify(get_or_create_profile(account), [&](profile_object& o) {
            o.user_name = user_name;
        });
    }

    void activity_tracker::set_metadata(const account_name_type& account, const digest_type& metadata_hash) {
        _db.modify(get_or_create_profile(account), [&](profile_object& o) {
            o.metadata_hash = metadata_hash;
        });
    }

    fc::optional<account_name_type> activity_tracker::username_owner(const string& name) const {
        fc::optional<account_name_type> result;
        if (!protocol::is_valid_username(name)) {
            return result;
        }

        const auto* u = _db.find<username_object, by_name>(account_name_type(protocol::trim_username(name)));
        if (u != nullptr) {
            result = u->owner;
        }
        return result;
    }

} } // crowdmod::chain
