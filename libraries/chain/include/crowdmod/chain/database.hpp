#pragma once

#include <crowdmod/chain/activity_tracker.hpp>
#include <crowdmod/chain/content_ledger.hpp>
#include <crowdmod/chain/evaluator_registry.hpp>
#include <crowdmod/chain/operation_notification.hpp>
#include <crowdmod/chain/platform_objects.hpp>
#include <crowdmod/chain/token_ledger.hpp>

#include <crowdmod/protocol/operations.hpp>

#include <fc/signals.hpp>

#include <boost/filesystem/path.hpp>

#include <memory>
#include <vector>

namespace crowdmod { namespace chain {

    using protocol::operation;

    struct genesis_account {
        account_name_type name;
        token_amount_type balance = 0;
        /// amount the platform account may spend on behalf of the account
        token_amount_type allowance = 0;
    };

    struct genesis_state {
        time_point_sec genesis_time;
        account_name_type administrator = CROWDMOD_DEFAULT_ADMINISTRATOR;
        account_name_type platform_account = CROWDMOD_DEFAULT_PLATFORM_ACCOUNT;
        std::vector<genesis_account> accounts;
    };

    /**
     * Platform state and the workflows changing it.
     *
     * Every operation is applied inside its own undo session: either all of its effects are
     * committed or none of them. Virtual operations emitted by a workflow are queued and only
     * delivered through applied_operation once the workflow has been committed.
     */
    class database : public chainbase::database {
    public:
        database();

        ~database();

        /**
         * Opens the shared memory state, initializing it from @p genesis when it is empty. The
         * genesis of an existing state is kept.
         */
        void open(const boost::filesystem::path& shared_mem_dir, uint64_t shared_file_size,
                const genesis_state& genesis);

        void close();

        /// removes the shared memory files, the database has to be reopened afterwards
        void wipe(const boost::filesystem::path& shared_mem_dir);

        /**
         * Validates and applies @p op as if submitted at @p now.
         *
         * @return virtual operations the workflow emitted
         */
        std::vector<operation> push_operation(const operation& op, const time_point_sec& now);

        /// replaces the bundled token ledger, e.g. with one backed by an external service
        void set_token_ledger(std::shared_ptr<token_ledger> ledger);

        /// @{ used by evaluators
        const time_point_sec& operation_time() const {
            return _operation_time;
        }

        content_ledger& contents();

        activity_tracker& activity();

        token_ledger& tokens();

        void push_virtual_operation(const operation& op);

        /// charges @p amount from @p payer to the platform account through its allowance
        void collect_fee(const account_name_type& payer, token_amount_type amount);

        void mint_reward(const account_name_type& owner, token_amount_type amount);

        void withdraw_fees(const account_name_type& administrator, token_amount_type amount);
        /// @}

        /// @{ read accessors
        const platform_property_object& get_platform_properties() const;

        user_profile get_profile(const account_name_type& account) const;

        fc::optional<account_name_type> get_username_owner(const string& name) const;

        uint64_t current_period_mau() const;

        std::vector<uint64_t> historic_mau() const;

        content_record get_content_by_id(const content_id& id) const;

        uint64_t get_content_library_length(content_type type) const;

        std::vector<content_id> get_replies_of(const content_id& id) const;

        std::vector<content_id> get_replied_by(const content_id& id) const;
        /// @}

        /**
         * Emitted for every committed operation, followed by the virtual operations it produced.
         */
        fc::signal<void(const operation_notification&)> applied_operation;

    private:
        void initialize_indexes();

        void initialize_evaluators();

        void init_genesis(const genesis_state& genesis);

        void notify_applied_operation(const operation& op, uint16_t virtual_op);

        const content_ledger& contents() const;

        const activity_tracker& activity() const;

        evaluator_registry<operation> _evaluator_registry;

        std::unique_ptr<content_ledger> _content_ledger;
        std::unique_ptr<activity_tracker> _activity_tracker;
        std::shared_ptr<token_ledger> _token_ledger;

        time_point_sec _operation_time;
        uint64_t _operation_sequence = 0;
        std::vector<operation> _pending_virtual_ops;
    };

} } // crowdmod::chain

FC_REFLECT((crowdmod::chain::genesis_account), (name)(balance)(allowance))
FC_REFLECT((crowdmod::chain::genesis_state), (genesis_time)(administrator)(platform_account)(accounts))
