#include <crowdmod/plugins/chain/plugin.hpp>
#include <crowdmod/protocol/exceptions.hpp>
#include <crowdmod/time/time.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/string.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace crowdmod { namespace plugins { namespace chain {

    namespace bfs = boost::filesystem;

    using namespace crowdmod::chain;
    using crowdmod::protocol::operation;

    class plugin::plugin_impl {
    public:
        void on_applied_operation(const operation_notification &note) {
            static fc::logger ledger_log = fc::logger::get("ledger");
            if (note.virtual_op == 0) {
                fc_dlog(ledger_log, "#${seq} ${name} at ${time}",
                    ("seq", note.sequence)("name", protocol::operation_name(note.op))("time", note.timestamp));
            } else {
                fc_ilog(ledger_log, "#${seq} ${op}", ("seq", note.sequence)("op", note.op));
            }
        }

        bfs::path shared_memory_dir;
        uint64_t shared_memory_size = 0;
        genesis_state genesis;
        bool wipe_state = false;
        fc::optional<bfs::path> import_file;

        database db;
    };

    plugin::plugin() {
    }

    plugin::~plugin() {
    }

    database &plugin::db() {
        return pimpl->db;
    }

    const database &plugin::db() const {
        return pimpl->db;
    }

    void plugin::set_program_options(
        boost::program_options::options_description &cli,
        boost::program_options::options_description &cfg
    ) {
        cfg.add_options()
            ("shared-file-dir", boost::program_options::value<bfs::path>()->default_value("state"),
                "the location of the state shared memory files (absolute path or relative to application data dir)")
            ("shared-file-size", boost::program_options::value<std::string>()->default_value("64M"),
                "Size of the shared memory file. Default: 64M")
            ("genesis-time", boost::program_options::value<std::string>(),
                "ISO-8601 start of the first 30-day activity period. Default: time of the first start")
            ("administrator", boost::program_options::value<std::string>()->default_value(CROWDMOD_DEFAULT_ADMINISTRATOR),
                "Account allowed to withdraw collected fees")
            ("platform-account", boost::program_options::value<std::string>()->default_value(CROWDMOD_DEFAULT_PLATFORM_ACCOUNT),
                "Account collecting fees")
            ("genesis-json", boost::program_options::value<bfs::path>(),
                "File with the initial token balances and allowances: {\"accounts\": [{\"name\", \"balance\", \"allowance\"}]}")
            ("import-operations", boost::program_options::value<bfs::path>(),
                "File with one {\"time\", \"op\"} record per line, replayed at startup");
        cli.add_options()
            ("wipe-state", boost::program_options::bool_switch()->default_value(false),
                "clear the state before opening it");
    }

    void plugin::plugin_initialize(const boost::program_options::variables_map &options) {
        ilog("Initializing chain plugin");

        pimpl.reset(new plugin_impl());

        auto sfd = options.at("shared-file-dir").as<bfs::path>();
        if (sfd.is_relative()) {
            pimpl->shared_memory_dir = appbase::app().data_dir() / sfd;
        } else {
            pimpl->shared_memory_dir = sfd;
        }

        pimpl->shared_memory_size = fc::parse_size(options.at("shared-file-size").as<std::string>());

        if (options.count("genesis-json")) {
            auto file = options.at("genesis-json").as<bfs::path>();
            pimpl->genesis = fc::json::from_file(fc::path(file.string())).as<genesis_state>();
        }

        if (options.count("genesis-time")) {
            pimpl->genesis.genesis_time = fc::time_point_sec::from_iso_string(options.at("genesis-time").as<std::string>());
        } else if (pimpl->genesis.genesis_time == fc::time_point_sec()) {
            pimpl->genesis.genesis_time = fc::time_point_sec(crowdmod::time::now());
        }

        pimpl->genesis.administrator = options.at("administrator").as<std::string>();
        pimpl->genesis.platform_account = options.at("platform-account").as<std::string>();

        pimpl->wipe_state = options.at("wipe-state").as<bool>();

        if (options.count("import-operations")) {
            pimpl->import_file = options.at("import-operations").as<bfs::path>();
        }

        pimpl->db.applied_operation.connect([this](const operation_notification &note) {
            pimpl->on_applied_operation(note);
        });
    }

    void plugin::plugin_startup() {
        ilog("Starting chain with shared_file_size: ${n} bytes", ("n", pimpl->shared_memory_size));

        if (pimpl->wipe_state) {
            ilog("Wiping state at ${dir}", ("dir", pimpl->shared_memory_dir.string()));
            pimpl->db.wipe(pimpl->shared_memory_dir);
        }

        try {
            pimpl->db.open(pimpl->shared_memory_dir, pimpl->shared_memory_size, pimpl->genesis);
        } catch (const fc::exception &e) {
            elog("Error opening state, please restart with --wipe-state: ${e}", ("e", e.to_detail_string()));
            throw;
        }

        if (pimpl->import_file) {
            import_operations(*pimpl->import_file);
        }
    }

    void plugin::plugin_shutdown() {
        ilog("closing chain database");
        pimpl->db.close();
        ilog("database closed successfully");
    }

    uint64_t plugin::import_operations(const bfs::path &file) {
        FC_ASSERT(bfs::exists(file), "Import file ${file} does not exist", ("file", file.string()));

        ilog("Importing operations from ${file}", ("file", file.string()));

        bfs::ifstream in(file);
        std::string line;
        uint64_t line_number = 0;
        uint64_t applied = 0;
        uint64_t failed = 0;

        while (std::getline(in, line)) {
            ++line_number;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            try {
                const auto record = fc::json::from_string(line).get_object();

                fc::time_point_sec when(crowdmod::time::now());
                if (record.contains("time")) {
                    when = record["time"].as<fc::time_point_sec>();
                }

                operation op;
                fc::from_variant(record["op"], op);

                pimpl->db.push_operation(op, when);
                ++applied;
            } catch (const fc::exception &e) {
                ++failed;
                wlog("Operation at line ${line} was rejected: ${e}", ("line", line_number)("e", e.to_string()));
            }
        }

        ilog("Imported ${applied} operations, ${failed} rejected", ("applied", applied)("failed", failed));
        return applied;
    }

} } } // crowdmod::plugins::chain
