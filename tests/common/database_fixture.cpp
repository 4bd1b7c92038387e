#include <boost/test/unit_test.hpp>

#include <crowdmod/time/time.hpp>

#include <fc/crypto/sha256.hpp>

#include "database_fixture.hpp"
#include "helpers.hpp"


uint32_t CROWDMOD_TESTING_GENESIS_TIMESTAMP = 1431700000;


namespace fc {

std::ostream& operator<<(std::ostream& out, const fc::exception& e) {
    out << e.to_detail_string();
    return out;
}

std::ostream& operator<<(std::ostream& out, const fc::time_point_sec& v) {
    out << v.to_iso_string();
    return out;
}

std::ostream& operator<<(std::ostream& out, const fc::fixed_string<fc::uint128_t>& v) {
    out << static_cast<std::string>(v);
    return out;
}

std::ostream& operator<<(std::ostream& out, const fc::sha256& v) {
    out << v.str();
    return out;
}

} // namespace fc


namespace crowdmod { namespace protocol {

std::ostream& operator<<(std::ostream& out, const content_id& v) {
    out << v.to_string();
    return out;
}

std::ostream& operator<<(std::ostream& out, content_type v) {
    out << content_type_name(v);
    return out;
}

} } // namespace crowdmod::protocol


namespace crowdmod { namespace chain {

        using std::cout;
        using std::cerr;

        static const token_amount_type voter_funds = 10 * CROWDMOD_FIXED_POINT_SCALE;

        database_fixture::database_fixture() {
            genesis.genesis_time = fc::time_point_sec(CROWDMOD_TESTING_GENESIS_TIMESTAMP);
            crowdmod::time::start_simulated_time(fc::time_point(genesis.genesis_time));

            int argc = boost::unit_test::framework::master_test_suite().argc;
            char **argv = boost::unit_test::framework::master_test_suite().argv;
            for (int i = 1; i < argc; i++) {
                const std::string arg = argv[i];
                if (arg == "--show-test-names") {
                    std::cout << "running test "
                              << boost::unit_test::framework::current_test_case().p_name
                              << std::endl;
                }
            }
        }

        database_fixture::~database_fixture() {
            close_database();
            crowdmod::time::stop_simulated_time();
        }

        void database_fixture::open_database() {
            if (!data_dir) {
                data_dir = fc::temp_directory(fc::temp_directory_path());
                db.reset(new chain::database());
                db->applied_operation.connect([&](const operation_notification& note) {
                    delivered.push_back(note.op);
                });
                db->open(data_dir->path(), 1024 * 1024 * 10, genesis); // 10 MB file for testing
            }
        }

        void database_fixture::close_database() {
            if (data_dir && db) {
                db->wipe(data_dir->path());
            }
            db.reset();
            data_dir.reset();
        }

        fc::time_point_sec database_fixture::now() const {
            return fc::time_point_sec(crowdmod::time::now());
        }

        void database_fixture::move_to_period(uint32_t period, uint32_t seconds) {
            const auto target = genesis.genesis_time + period * CROWDMOD_MAU_PERIOD_SECONDS + seconds;
            crowdmod::time::advance_simulated_time_to(fc::time_point(target));
        }

        void database_fixture::advance(uint32_t seconds) {
            crowdmod::time::advance_time(seconds);
        }

        std::vector<operation> database_fixture::push(const operation& op) {
            return db->push_operation(op, now());
        }

        database_token_ledger& database_fixture::ledger() {
            return dynamic_cast<database_token_ledger&>(db->tokens());
        }

        void database_fixture::fund(const string& account, token_amount_type amount, token_amount_type allowance) {
            const auto& platform = db->get_platform_properties().platform_account;
            ledger().mint(account, amount);
            ledger().approve(account, platform, allowance);
        }

        void database_fixture::fund(const string& account, token_amount_type amount) {
            fund(account, amount, amount);
        }

        token_amount_type database_fixture::balance(const string& account) {
            return db->tokens().balance_of(account);
        }

        digest_type database_fixture::hash(const string& data) {
            return fc::sha256::hash(data);
        }

        content_id database_fixture::upload(const string& creator, content_type type, const string& data) {
            upload_operation op;
            op.creator = creator;
            op.content_hash = hash(data);
            op.metadata_hash = hash(data + ":meta");
            op.type = type;

            const auto emitted = push(op);
            BOOST_REQUIRE_EQUAL(emitted.size(), 1);
            const auto& uploaded = emitted.front().get<uploaded_operation>();
            return content_id(uploaded.type, uploaded.index);
        }

        void database_fixture::like(const string& voter, const content_id& id) {
            like_operation op;
            op.voter = voter;
            op.content = id;
            push(op);
        }

        void database_fixture::dislike(const string& voter, const content_id& id) {
            dislike_operation op;
            op.voter = voter;
            op.content = id;
            push(op);
        }

        string database_fixture::voter_name(uint32_t n) {
            return "voter" + std::to_string(n);
        }

        content_id database_fixture::upload_with_votes(
            const string& creator, uint32_t likes, uint32_t dislikes, content_type type
        ) {
            const auto id = upload(creator, type, creator + std::to_string(voter_count));
            for (uint32_t i = 0; i < likes + dislikes; i++) {
                const auto voter = voter_name(voter_count++);
                fund(voter, voter_funds);
                if (i < likes) {
                    like(voter, id);
                } else {
                    dislike(voter, id);
                }
            }
            return id;
        }

        clean_database_fixture::clean_database_fixture() {
            try {
                open_database();
            } catch (const fc::exception &e) {
                edump((e.to_detail_string()));
                throw;
            }
        }

        clean_database_fixture::~clean_database_fixture() {
        }

} } // crowdmod::chain
