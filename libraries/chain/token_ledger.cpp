#include <crowdmod/chain/token_ledger.hpp>
#include <crowdmod/chain/utilities/economics.hpp>
#include <crowdmod/protocol/exceptions.hpp>

namespace crowdmod { namespace chain {

    database_token_ledger::database_token_ledger(chainbase::database& db, const account_name_type& platform_account)
            : _db(db), _platform_account(platform_account) {
    }

    token_amount_type database_token_ledger::balance_of(const account_name_type& account) const {
        const auto* b = _db.find<token_balance_object, by_account>(account);
        return b != nullptr ? b->balance : token_amount_type(0);
    }

    token_amount_type database_token_ledger::allowance(
        const account_name_type& owner, const account_name_type& spender
    ) const {
        const auto* a = _db.find<token_allowance_object, by_owner_spender>(std::make_tuple(owner, spender));
        return a != nullptr ? a->amount : token_amount_type(0);
    }

    void database_token_ledger::transfer_from(
        const account_name_type& from, const account_name_type& to, token_amount_type amount
    ) {
        const auto* a = _db.find<token_allowance_object, by_owner_spender>(std::make_tuple(from, _platform_account));
        const token_amount_type allowed = a != nullptr ? a->amount : token_amount_type(0);
        CROWDMOD_ASSERT(allowed >= amount, insufficient_allowance,
            "Account ${owner} allows ${spender} to spend ${allowed}, required ${amount}",
            ("owner", from)("spender", _platform_account)("allowed", allowed)("amount", amount));

        move(from, to, amount);

        if (a != nullptr) {
            _db.modify(*a, [&](token_allowance_object& o) {
                o.amount -= amount;
            });
        }
    }

    void database_token_ledger::transfer(const account_name_type& to, token_amount_type amount) {
        move(_platform_account, to, amount);
    }

    void database_token_ledger::mint(const account_name_type& to, token_amount_type amount) {
        CROWDMOD_CHECK_VALUE(to != account_name_type(), "Cannot mint to an empty account", ("amount", amount));
        credit(to, amount);
    }

    void database_token_ledger::approve(
        const account_name_type& owner, const account_name_type& spender, token_amount_type amount
    ) {
        const auto* a = _db.find<token_allowance_object, by_owner_spender>(std::make_tuple(owner, spender));
        if (a != nullptr) {
            _db.modify(*a, [&](token_allowance_object& o) {
                o.amount = amount;
            });
        } else {
            _db.create<token_allowance_object>([&](token_allowance_object& o) {
                o.owner = owner;
                o.spender = spender;
                o.amount = amount;
            });
        }
    }

    void database_token_ledger::move(
        const account_name_type& from, const account_name_type& to, token_amount_type amount
    ) {
        CROWDMOD_CHECK_VALUE(to != account_name_type(), "Cannot transfer to an empty account",
            ("from", from)("amount", amount));
        debit(from, amount);
        credit(to, amount);
    }

    void database_token_ledger::credit(const account_name_type& account, token_amount_type amount) {
        const auto* b = _db.find<token_balance_object, by_account>(account);
        if (b != nullptr) {
            const auto balance = utilities::checked_add(b->balance, amount);
            _db.modify(*b, [&](token_balance_object& o) {
                o.balance = balance;
            });
        } else {
            _db.create<token_balance_object>([&](token_balance_object& o) {
                o.account = account;
                o.balance = amount;
            });
        }
    }

    void database_token_ledger::debit(const account_name_type& account, token_amount_type amount) {
        const auto balance = balance_of(account);
        CROWDMOD_ASSERT(balance >= amount, insufficient_funds,
            "Account ${account} has ${balance}, required ${amount}",
            ("account", account)("balance", balance)("amount", amount));
        if (amount == 0) {
            return;
        }
        _db.modify(_db.get<token_balance_object, by_account>(account), [&](token_balance_object& o) {
            o.balance -= amount;
        });
    }

} } // crowdmod::chain
