#include <crowdmod/protocol/operations.hpp>
#include <crowdmod/protocol/exceptions.hpp>

#include <fc/variant.hpp>

#include <map>

namespace crowdmod { namespace protocol {

    namespace {
        struct is_vop_visitor {
            typedef bool result_type;

            template<typename T>
            bool operator()(const T& v) const {
                return v.is_virtual();
            }
        };

        struct operation_validate_visitor {
            typedef void result_type;

            template<typename T>
            void operator()(const T& v) const {
                v.validate();
            }
        };

        struct operation_get_required_auth_visitor {
            typedef void result_type;

            flat_set<account_name_type>& authorities;

            operation_get_required_auth_visitor(flat_set<account_name_type>& a)
                    : authorities(a) {
            }

            template<typename T>
            void operator()(const T& v) const {
                v.get_required_authorities(authorities);
            }
        };

        /// "crowdmod::protocol::upload_operation" -> "upload"
        struct get_operation_name {
            typedef void result_type;

            string& name;

            get_operation_name(string& n)
                    : name(n) {
            }

            template<typename T>
            void operator()(const T&) const {
                string full = fc::get_typename<T>::name();
                auto start = full.find_last_of(':');
                if (start != string::npos) {
                    full = full.substr(start + 1);
                }
                const string suffix = "_operation";
                if (full.size() > suffix.size() &&
                    full.compare(full.size() - suffix.size(), suffix.size(), suffix) == 0) {
                    full.resize(full.size() - suffix.size());
                }
                name = full;
            }
        };

        const std::map<string, int>& operation_name_map() {
            static const std::map<string, int> names = [] {
                std::map<string, int> result;
                for (int i = 0; i < operation::count(); ++i) {
                    operation op;
                    op.set_which(i);
                    string name;
                    op.visit(get_operation_name(name));
                    result[name] = i;
                }
                return result;
            }();
            return names;
        }
    }

    bool is_virtual_operation(const operation& op) {
        return op.visit(is_vop_visitor());
    }

    void operation_validate(const operation& op) {
        op.visit(operation_validate_visitor());
    }

    void operation_get_required_authorities(const operation& op, flat_set<account_name_type>& authorities) {
        op.visit(operation_get_required_auth_visitor(authorities));
    }

    std::string operation_name(const operation& op) {
        string name;
        op.visit(get_operation_name(name));
        return name;
    }

} } // crowdmod::protocol

namespace fc {

    void to_variant(const crowdmod::protocol::operation& var, fc::variant& vo) {
        fc::variant value;
        var.visit(fc::from_static_variant(value));
        vo = fc::variants{fc::variant(crowdmod::protocol::operation_name(var)), value};
    }

    void from_variant(const fc::variant& var, crowdmod::protocol::operation& vo) {
        const auto& ar = var.get_array();
        FC_ASSERT(ar.size() == 2, "Operation must be a pair of name and body");

        if (ar[0].is_uint64()) {
            vo.set_which(ar[0].as_uint64());
        } else {
            const auto& names = crowdmod::protocol::operation_name_map();
            auto itr = names.find(ar[0].as_string());
            FC_ASSERT(itr != names.end(), "Invalid operation name: ${n}", ("n", ar[0]));
            vo.set_which(itr->second);
        }
        vo.visit(fc::to_static_variant(ar[1]));
    }

} // fc
