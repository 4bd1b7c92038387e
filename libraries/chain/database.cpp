#include <crowdmod/chain/database.hpp>
#include <crowdmod/chain/database_exceptions.hpp>
#include <crowdmod/chain/platform_evaluator.hpp>
#include <crowdmod/chain/utilities/economics.hpp>

#include <fc/log/logger.hpp>

namespace crowdmod { namespace chain {

    database::database()
            : _evaluator_registry(*this) {
        initialize_evaluators();
    }

    database::~database() {
    }

    void database::open(
        const boost::filesystem::path& shared_mem_dir, uint64_t shared_file_size, const genesis_state& genesis
    ) {
        try {
            chainbase::database::open(shared_mem_dir, chainbase::database::read_write, shared_file_size);

            initialize_indexes();

            _content_ledger.reset(new content_ledger(*this));

            if (get_index<platform_property_index>().indices().empty()) {
                init_genesis(genesis);
            }

            const auto& props = get_platform_properties();
            _activity_tracker.reset(new activity_tracker(*this, props.genesis_time));
            if (!_token_ledger) {
                _token_ledger = std::make_shared<database_token_ledger>(*this, props.platform_account);
            }

            ilog("Opened state at ${dir}, genesis ${genesis}, administrator ${admin}, platform account ${platform}",
                ("dir", shared_mem_dir.string())("genesis", props.genesis_time)
                ("admin", props.administrator)("platform", props.platform_account));
        } FC_CAPTURE_LOG_AND_RETHROW((shared_mem_dir)(shared_file_size))
    }

    void database::close() {
        try {
            _pending_virtual_ops.clear();
            _token_ledger.reset();
            _activity_tracker.reset();
            _content_ledger.reset();
            chainbase::database::flush();
            chainbase::database::close();
        } FC_CAPTURE_AND_RETHROW()
    }

    void database::wipe(const boost::filesystem::path& shared_mem_dir) {
        close();
        chainbase::database::wipe(shared_mem_dir);
    }

    void database::initialize_indexes() {
        add_index<platform_property_index>();
        add_index<content_library_index>();
        add_index<content_index>();
        add_index<content_link_index>();
        add_index<profile_index>();
        add_index<username_index>();
        add_index<mau_bucket_index>();
        add_index<token_balance_index>();
        add_index<token_allowance_index>();
    }

    void database::initialize_evaluators() {
        _evaluator_registry.register_evaluator<upload_evaluator>();
        _evaluator_registry.register_evaluator<like_evaluator>();
        _evaluator_registry.register_evaluator<dislike_evaluator>();
        _evaluator_registry.register_evaluator<harvest_likes_evaluator>();
        _evaluator_registry.register_evaluator<deletion_evaluator>();
        _evaluator_registry.register_evaluator<voluntarily_delete_evaluator>();
        _evaluator_registry.register_evaluator<reply_evaluator>();
        _evaluator_registry.register_evaluator<withdraw_evaluator>();
        _evaluator_registry.register_evaluator<create_user_evaluator>();
        _evaluator_registry.register_evaluator<update_metadata_evaluator>();
    }

    void database::init_genesis(const genesis_state& genesis) {
        try {
            CROWDMOD_CHECK_VALUE(genesis.administrator != account_name_type(), "Administrator must be set");
            CROWDMOD_CHECK_VALUE(genesis.platform_account != account_name_type(), "Platform account must be set");

            create<platform_property_object>([&](platform_property_object& p) {
                p.genesis_time = genesis.genesis_time;
                p.administrator = genesis.administrator;
                p.platform_account = genesis.platform_account;
            });

            _content_ledger->initialize();

            database_token_ledger ledger(*this, genesis.platform_account);
            for (const auto& a : genesis.accounts) {
                ledger.mint(a.name, a.balance);
                if (a.allowance > 0) {
                    ledger.approve(a.name, genesis.platform_account, a.allowance);
                }
            }

            ilog("Initialized genesis at ${time} with ${n} funded accounts",
                ("time", genesis.genesis_time)("n", genesis.accounts.size()));
        } FC_CAPTURE_AND_RETHROW((genesis))
    }

    std::vector<operation> database::push_operation(const operation& op, const time_point_sec& now) {
        try {
            CROWDMOD_ASSERT(!protocol::is_virtual_operation(op), unsupported_operation,
                "Virtual operation ${name} cannot be pushed", ("name", protocol::operation_name(op)));
            protocol::operation_validate(op);

            const auto& props = get_platform_properties();
            CROWDMOD_CHECK_VALUE(now >= props.genesis_time, "Operation at ${now} precedes genesis ${genesis}",
                ("now", now)("genesis", props.genesis_time));
            CROWDMOD_CHECK_VALUE(now >= props.last_operation_time,
                "Operation at ${now} precedes the last applied operation at ${last}",
                ("now", now)("last", props.last_operation_time));

            _pending_virtual_ops.clear();
            _operation_time = now;

            auto session = start_undo_session(true);
            _evaluator_registry.get_evaluator(op).apply(op);
            modify(props, [&](platform_property_object& p) {
                p.last_operation_time = now;
            });
            session.push();
            commit(revision());

            dlog("Applied ${name} at ${now}", ("name", protocol::operation_name(op))("now", now));

            std::vector<operation> emitted;
            emitted.swap(_pending_virtual_ops);

            _operation_sequence++;
            notify_applied_operation(op, 0);
            uint16_t virtual_op = 0;
            for (const auto& vop : emitted) {
                notify_applied_operation(vop, ++virtual_op);
            }
            return emitted;
        } FC_CAPTURE_AND_RETHROW((op)(now))
    }

    void database::notify_applied_operation(const operation& op, uint16_t virtual_op) {
        operation_notification note(op);
        note.timestamp = _operation_time;
        note.sequence = _operation_sequence;
        note.virtual_op = virtual_op;
        CROWDMOD_TRY_NOTIFY(applied_operation, note)
    }

    void database::set_token_ledger(std::shared_ptr<token_ledger> ledger) {
        _token_ledger = std::move(ledger);
    }

    content_ledger& database::contents() {
        FC_ASSERT(_content_ledger, "Database is not open");
        return *_content_ledger;
    }

    const content_ledger& database::contents() const {
        FC_ASSERT(_content_ledger, "Database is not open");
        return *_content_ledger;
    }

    activity_tracker& database::activity() {
        FC_ASSERT(_activity_tracker, "Database is not open");
        return *_activity_tracker;
    }

    const activity_tracker& database::activity() const {
        FC_ASSERT(_activity_tracker, "Database is not open");
        return *_activity_tracker;
    }

    token_ledger& database::tokens() {
        FC_ASSERT(_token_ledger, "Database is not open");
        return *_token_ledger;
    }

    void database::push_virtual_operation(const operation& op) {
        FC_ASSERT(protocol::is_virtual_operation(op));
        _pending_virtual_ops.push_back(op);
    }

    void database::collect_fee(const account_name_type& payer, token_amount_type amount) {
        const auto& props = get_platform_properties();
        auto& ledger = tokens();

        const auto balance = ledger.balance_of(payer);
        CROWDMOD_ASSERT(balance >= amount, insufficient_funds,
            "Account ${account} has ${balance}, fee is ${amount}",
            ("account", payer)("balance", balance)("amount", amount));

        const auto allowed = ledger.allowance(payer, props.platform_account);
        CROWDMOD_ASSERT(allowed >= amount, insufficient_allowance,
            "Account ${owner} allows ${spender} to spend ${allowed}, fee is ${amount}",
            ("owner", payer)("spender", props.platform_account)("allowed", allowed)("amount", amount));

        ledger.transfer_from(payer, props.platform_account, amount);

        const auto collected = utilities::checked_add(props.collected_fees, amount);
        modify(props, [&](platform_property_object& p) {
            p.collected_fees = collected;
        });
    }

    void database::mint_reward(const account_name_type& owner, token_amount_type amount) {
        const auto& props = get_platform_properties();
        tokens().mint(owner, amount);

        const auto minted = utilities::checked_add(props.minted_rewards, amount);
        modify(props, [&](platform_property_object& p) {
            p.minted_rewards = minted;
        });
    }

    void database::withdraw_fees(const account_name_type& administrator, token_amount_type amount) {
        const auto& props = get_platform_properties();
        tokens().transfer(administrator, amount);

        const auto withdrawn = utilities::checked_add(props.withdrawn_fees, amount);
        modify(props, [&](platform_property_object& p) {
            p.withdrawn_fees = withdrawn;
        });
    }

    const platform_property_object& database::get_platform_properties() const {
        try {
            return get<platform_property_object>();
        } FC_CAPTURE_AND_RETHROW()
    }

    user_profile database::get_profile(const account_name_type& account) const {
        return activity().profile(account);
    }

    fc::optional<account_name_type> database::get_username_owner(const string& name) const {
        return activity().username_owner(name);
    }

    uint64_t database::current_period_mau() const {
        return activity().current_period_mau();
    }

    std::vector<uint64_t> database::historic_mau() const {
        return activity().historic_mau();
    }

    content_record database::get_content_by_id(const content_id& id) const {
        return contents().get(id);
    }

    uint64_t database::get_content_library_length(content_type type) const {
        return contents().library_length(type);
    }

    std::vector<content_id> database::get_replies_of(const content_id& id) const {
        return contents().replies_of(id);
    }

    std::vector<content_id> database::get_replied_by(const content_id& id) const {
        return contents().replied_by_of(id);
    }

} } // crowdmod::chain
