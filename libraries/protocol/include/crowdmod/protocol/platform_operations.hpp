#pragma once

#include <crowdmod/protocol/base.hpp>

namespace crowdmod { namespace protocol {

    /**
     * Publishes a new content record. Accounts with strikes pay an escalating fee first.
     */
    struct upload_operation : public base_operation {
        account_name_type creator;
        digest_type content_hash;
        digest_type metadata_hash;
        content_type type = content_type::post;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(creator);
        }
    };

    struct like_operation : public base_operation {
        account_name_type voter;
        content_id content;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(voter);
        }
    };

    struct dislike_operation : public base_operation {
        account_name_type voter;
        content_id content;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(voter);
        }
    };

    /**
     * Mints the reward for every net like not yet paid out to the owner of the content.
     * Anyone may trigger it, the reward always goes to the owner.
     */
    struct harvest_likes_operation : public base_operation {
        account_name_type account;
        content_id content;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(account);
        }
    };

    /**
     * Removes content the crowd has statistically disapproved and strikes its owner.
     */
    struct deletion_operation : public base_operation {
        account_name_type account;
        content_id content;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(account);
        }
    };

    struct voluntarily_delete_operation : public base_operation {
        account_name_type owner;
        content_id content;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(owner);
        }
    };

    struct reply_operation : public base_operation {
        account_name_type author;
        content_id reply;
        content_id target;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(author);
        }
    };

    /**
     * Moves every collected fee to the administrator.
     */
    struct withdraw_operation : public base_operation {
        account_name_type administrator;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(administrator);
        }
    };

    struct create_user_operation : public base_operation {
        account_name_type account;
        string name;
        digest_type metadata_hash;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(account);
        }
    };

    struct update_metadata_operation : public base_operation {
        account_name_type account;
        digest_type metadata_hash;

        void validate() const;

        void get_required_authorities(flat_set<account_name_type>& a) const {
            a.insert(account);
        }
    };

} } // crowdmod::protocol

FC_REFLECT((crowdmod::protocol::upload_operation), (creator)(content_hash)(metadata_hash)(type))
FC_REFLECT((crowdmod::protocol::like_operation), (voter)(content))
FC_REFLECT((crowdmod::protocol::dislike_operation), (voter)(content))
FC_REFLECT((crowdmod::protocol::harvest_likes_operation), (account)(content))
FC_REFLECT((crowdmod::protocol::deletion_operation), (account)(content))
FC_REFLECT((crowdmod::protocol::voluntarily_delete_operation), (owner)(content))
FC_REFLECT((crowdmod::protocol::reply_operation), (author)(reply)(target))
FC_REFLECT((crowdmod::protocol::withdraw_operation), (administrator))
FC_REFLECT((crowdmod::protocol::create_user_operation), (account)(name)(metadata_hash))
FC_REFLECT((crowdmod::protocol::update_metadata_operation), (account)(metadata_hash))
