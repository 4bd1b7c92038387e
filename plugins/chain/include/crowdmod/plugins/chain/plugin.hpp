#pragma once

#include <appbase/application.hpp>

#include <crowdmod/chain/database.hpp>

#include <boost/filesystem/path.hpp>

namespace crowdmod { namespace plugins { namespace chain {

    class plugin final : public appbase::plugin<plugin> {
    public:
        APPBASE_PLUGIN_REQUIRES()

        plugin();

        ~plugin();

        constexpr static const char *plugin_name = "chain";

        static const std::string &name() {
            static std::string name = plugin_name;
            return name;
        }

        void set_program_options(
            boost::program_options::options_description &cli,
            boost::program_options::options_description &cfg) override;

        void plugin_initialize(const boost::program_options::variables_map &options) override;

        void plugin_startup() override;

        void plugin_shutdown() override;

        /**
         * Replays a file with one {"time": ..., "op": [name, {...}]} record per line.
         * Records without a time are applied at the current time.
         *
         * @return count of operations that were committed
         */
        uint64_t import_operations(const boost::filesystem::path &file);

        crowdmod::chain::database &db();

        const crowdmod::chain::database &db() const;

    private:
        class plugin_impl;

        std::unique_ptr<plugin_impl> pimpl;
    };

} } } // crowdmod::plugins::chain
