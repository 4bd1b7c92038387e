#include <crowdmod/protocol/platform_operations.hpp>
#include <crowdmod/protocol/exceptions.hpp>
#include <crowdmod/protocol/validate_helper.hpp>
#include <crowdmod/protocol/username.hpp>

namespace crowdmod { namespace protocol {

    static inline void validate_account_name(const account_name_type& name) {
        const auto size = string(name).size();
        CROWDMOD_CHECK_VALUE(size >= CROWDMOD_MIN_ACCOUNT_NAME_LENGTH && size <= CROWDMOD_MAX_ACCOUNT_NAME_LENGTH,
            "Account name ${name} is invalid", ("name", name));
    }

    static inline void validate_content_id(const content_id& id) {
        CROWDMOD_CHECK_VALUE(is_valid_content_type(id.type),
            "Unknown content type ${type}", ("type", uint8_t(id.type)));
    }

    void upload_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(creator);
        CROWDMOD_CHECK_PARAM_DIGEST(content_hash);
        CROWDMOD_CHECK_PARAM(type, CROWDMOD_CHECK_VALUE(is_valid_content_type(type),
            "Unknown content type ${type}", ("type", uint8_t(type))));
    }

    void like_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(voter);
        CROWDMOD_CHECK_PARAM_CONTENT(content);
    }

    void dislike_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(voter);
        CROWDMOD_CHECK_PARAM_CONTENT(content);
    }

    void harvest_likes_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(account);
        CROWDMOD_CHECK_PARAM_CONTENT(content);
    }

    void deletion_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(account);
        CROWDMOD_CHECK_PARAM_CONTENT(content);
    }

    void voluntarily_delete_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(owner);
        CROWDMOD_CHECK_PARAM_CONTENT(content);
    }

    void reply_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(author);
        CROWDMOD_CHECK_PARAM_CONTENT(reply);
        CROWDMOD_CHECK_PARAM_CONTENT(target);
    }

    void withdraw_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(administrator);
    }

    void create_user_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(account);
        CROWDMOD_CHECK_PARAM(name, validate_username(name));
    }

    void update_metadata_operation::validate() const {
        CROWDMOD_CHECK_PARAM_ACCOUNT(account);
    }

} } // crowdmod::protocol
