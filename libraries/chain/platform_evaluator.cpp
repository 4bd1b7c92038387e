#include <crowdmod/chain/platform_evaluator.hpp>
#include <crowdmod/chain/database.hpp>
#include <crowdmod/chain/utilities/economics.hpp>
#include <crowdmod/protocol/exceptions.hpp>

namespace crowdmod { namespace chain {

    void upload_evaluator::do_apply(const upload_operation& o) {
        try {
            auto& activity = _db.activity();

            const auto strikes = activity.profile(o.creator).strikes;
            if (strikes > 0) {
                const auto fee = utilities::fee_for_strikes(strikes, activity.current_period_mau());
                _db.collect_fee(o.creator, fee);
            }

            activity.log_interaction(o.creator, _db.operation_time());

            content_record record;
            record.owner = o.creator;
            record.content_hash = o.content_hash;
            record.metadata_hash = o.metadata_hash;
            const auto id = _db.contents().create(record, o.type);

            _db.push_virtual_operation(uploaded_operation(o.creator, id.index, id.type));
        } FC_CAPTURE_AND_RETHROW((o))
    }

    void like_evaluator::do_apply(const like_operation& o) {
        auto& activity = _db.activity();
        auto& contents = _db.contents();

        _db.collect_fee(o.voter, utilities::fee(activity.current_period_mau()));

        auto record = contents.get(o.content);
        record.likes++;
        contents.update(o.content, record);

        activity.log_interaction(o.voter, _db.operation_time());

        _db.push_virtual_operation(liked_operation(o.content.index, o.content.type));
    }

    void dislike_evaluator::do_apply(const dislike_operation& o) {
        auto& activity = _db.activity();
        auto& contents = _db.contents();

        _db.collect_fee(o.voter, utilities::fee(activity.current_period_mau()));

        auto record = contents.get(o.content);
        record.dislikes++;
        contents.update(o.content, record);

        activity.log_interaction(o.voter, _db.operation_time());

        _db.push_virtual_operation(disliked_operation(o.content.index, o.content.type));
    }

    void harvest_likes_evaluator::do_apply(const harvest_likes_operation& o) {
        try {
            auto& contents = _db.contents();
            auto record = contents.get(o.content);

            CROWDMOD_CHECK_LOGIC(record.likes > record.dislikes,
                    logic_exception::net_likes_must_be_positive,
                    "Content ${content} has ${likes} likes and ${dislikes} dislikes",
                    ("content", o.content)("likes", record.likes)("dislikes", record.dislikes));

            CROWDMOD_CHECK_LOGIC(!utilities::should_eliminate(record.likes, record.dislikes),
                    logic_exception::content_is_eliminated,
                    "Content ${content} is eligible for elimination",
                    ("content", o.content));

            // same as likes > dislikes + harvested_likes without the sum
            CROWDMOD_CHECK_LOGIC(record.likes - record.dislikes > record.harvested_likes,
                    logic_exception::no_likes_to_harvest,
                    "All ${harvested} net likes of ${content} were already harvested",
                    ("content", o.content)("harvested", record.harvested_likes));

            const uint64_t unharvested = record.likes - record.dislikes - record.harvested_likes;
            const auto amount = utilities::reward_for_likes(unharvested, _db.activity().current_period_mau());

            _db.mint_reward(record.owner, amount);

            record.harvested_likes += unharvested;
            contents.update(o.content, record);

            _db.push_virtual_operation(harvested_operation(o.content.index, o.content.type, amount));
        } FC_CAPTURE_AND_RETHROW((o))
    }

    void deletion_evaluator::do_apply(const deletion_operation& o) {
        auto& contents = _db.contents();
        const auto record = contents.get(o.content);

        CROWDMOD_CHECK_LOGIC(utilities::should_eliminate(record.likes, record.dislikes),
                logic_exception::content_is_not_eliminated,
                "Content ${content} is not eligible for elimination",
                ("content", o.content)("likes", record.likes)("dislikes", record.dislikes));

        contents.remove(o.content);
        _db.activity().add_strike(record.owner);

        _db.push_virtual_operation(deleted_operation(
                record.owner, record.content_hash, record.metadata_hash, o.content.index, o.content.type));
    }

    void voluntarily_delete_evaluator::do_apply(const voluntarily_delete_operation& o) {
        auto& contents = _db.contents();
        const auto record = contents.get(o.content);

        CROWDMOD_CHECK_AUTHORITY(o.owner, record.owner, "content owner");

        contents.remove(o.content);
    }

    void reply_evaluator::do_apply(const reply_operation& o) {
        auto& contents = _db.contents();
        const auto record = contents.get(o.reply);

        CROWDMOD_CHECK_AUTHORITY(o.author, record.owner, "reply owner");

        contents.link(o.reply, o.target);

        _db.push_virtual_operation(replied_operation(o.reply, o.target));
    }

    void withdraw_evaluator::do_apply(const withdraw_operation& o) {
        const auto& props = _db.get_platform_properties();
        CROWDMOD_CHECK_AUTHORITY(o.administrator, props.administrator, "administrator");

        // tokens the platform account holds for other reasons are not fees
        const auto pending = props.collected_fees - props.withdrawn_fees;
        CROWDMOD_CHECK_LOGIC(pending > 0,
                logic_exception::nothing_to_withdraw,
                "Platform account ${platform} holds no fees",
                ("platform", props.platform_account)("collected", props.collected_fees)
                ("withdrawn", props.withdrawn_fees));

        _db.withdraw_fees(o.administrator, pending);
    }

    void create_user_evaluator::do_apply(const create_user_operation& o) {
        auto& activity = _db.activity();
        activity.register_username(o.account, o.name);
        activity.set_metadata(o.account, o.metadata_hash);
    }

    void update_metadata_evaluator::do_apply(const update_metadata_operation& o) {
        _db.activity().set_metadata(o.account, o.metadata_hash);
    }

} } // crowdmod::chain
