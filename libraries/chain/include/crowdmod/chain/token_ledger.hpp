#pragma once

#include <crowdmod/chain/token_objects.hpp>

namespace crowdmod { namespace chain {

    /**
     * Fungible token the platform charges fees and pays rewards in. The ledger is bound to the
     * platform account: it is the spender of transfer_from() and the sender of transfer().
     *
     * Implementations must apply their changes inside the undo session of the database, otherwise
     * a failed workflow would keep its token movements.
     */
    class token_ledger {
    public:
        virtual ~token_ledger() = default;

        virtual token_amount_type balance_of(const account_name_type& account) const = 0;

        virtual token_amount_type allowance(const account_name_type& owner, const account_name_type& spender) const = 0;

        /// moves amount from an account to another, spending the allowance granted to the platform
        virtual void transfer_from(const account_name_type& from, const account_name_type& to, token_amount_type amount) = 0;

        /// moves amount from the platform account
        virtual void transfer(const account_name_type& to, token_amount_type amount) = 0;

        virtual void mint(const account_name_type& to, token_amount_type amount) = 0;
    };

    /**
     * token_ledger kept in the chainbase database itself.
     */
    class database_token_ledger final : public token_ledger {
    public:
        database_token_ledger(chainbase::database& db, const account_name_type& platform_account);

        token_amount_type balance_of(const account_name_type& account) const override;

        token_amount_type allowance(const account_name_type& owner, const account_name_type& spender) const override;

        void transfer_from(const account_name_type& from, const account_name_type& to, token_amount_type amount) override;

        void transfer(const account_name_type& to, token_amount_type amount) override;

        void mint(const account_name_type& to, token_amount_type amount) override;

        /// sets the amount spender may move out of the balance of owner
        void approve(const account_name_type& owner, const account_name_type& spender, token_amount_type amount);

    private:
        void move(const account_name_type& from, const account_name_type& to, token_amount_type amount);

        void credit(const account_name_type& account, token_amount_type amount);

        void debit(const account_name_type& account, token_amount_type amount);

        chainbase::database& _db;
        account_name_type _platform_account;
    };

} } // crowdmod::chain
