#pragma once

#include <fc/exception/exception.hpp>
#include <crowdmod/protocol/types.hpp>

#include <boost/preprocessor/stringize.hpp>

#define CROWDMOD_ASSERT_MESSAGE(FORMAT, ...) \
    FC_LOG_MESSAGE(error, FORMAT, __VA_ARGS__)

#define CROWDMOD_ASSERT(expr, exception_type, FORMAT, ...) \
    FC_MULTILINE_MACRO_BEGIN \
        if (!(expr)) { \
            throw exception_type(CROWDMOD_ASSERT_MESSAGE(FORMAT, __VA_ARGS__)); \
        } \
    FC_MULTILINE_MACRO_END

#define CROWDMOD_DECLARE_DERIVED_EXCEPTION_BODY(TYPE, BASE, CODE, WHAT) \
    public: \
        enum code_enum { \
            code_value = CODE, \
        }; \
        TYPE(fc::log_message&& m) \
            : BASE(fc::move(m), CODE, BOOST_PP_STRINGIZE(TYPE), WHAT) {} \
        TYPE() \
            : BASE(CODE, BOOST_PP_STRINGIZE(TYPE), WHAT) {} \
        virtual std::shared_ptr<fc::exception> dynamic_copy_exception() const { \
            return std::make_shared<TYPE>(*this); \
        } \
        virtual NO_RETURN void dynamic_rethrow_exception() const { \
            if (code() == CODE) { \
                throw *this; \
            } else { \
                fc::exception::dynamic_rethrow_exception(); \
            } \
        } \
    protected: \
        TYPE(const BASE& c) \
            : BASE(c) {} \
        explicit TYPE(int64_t code, const std::string& name_value, const std::string& what_value) \
            : BASE(code, name_value, what_value) {} \
        explicit TYPE(fc::log_message&& m, int64_t code, const std::string& name_value, const std::string& what_value) \
            : BASE(std::move(m), code, name_value, what_value) {}

#define CROWDMOD_DECLARE_DERIVED_EXCEPTION(TYPE, BASE, CODE, WHAT) \
    class TYPE: public BASE { \
        CROWDMOD_DECLARE_DERIVED_EXCEPTION_BODY(TYPE, BASE, CODE, WHAT) \
    };

#define CROWDMOD_CHECK_LOGIC(expr, TYPE, MSG, ...) \
        CROWDMOD_ASSERT(expr, crowdmod::logic_exception, MSG, ("errid", TYPE)("namespace",crowdmod::get_logic_error_namespace<decltype(TYPE)>())__VA_ARGS__)

#define CROWDMOD_CHECK_PARAM(PARAM, VALIDATOR) CROWDMOD_CHECK_PARAM_I(PARAM, PARAM, VALIDATOR, "")

#define CROWDMOD_CHECK_PARAM_I(PARAM, VALUE, VALIDATOR, TYPE) \
    FC_MULTILINE_MACRO_BEGIN \
        try { \
            VALIDATOR; \
        } catch (const crowdmod::invalid_value& e) { \
            FC_THROW_EXCEPTION(crowdmod::invalid_parameter, "Invalid value \"${value}\" for " TYPE "parameter \"${param}\": ${errmsg}", \
                    ("param", FC_STRINGIZE(PARAM)) \
                    ("value", VALUE) \
                    ("errmsg", e.to_string()) \
                    ("error", static_cast<fc::exception>(e))); \
        } \
    FC_MULTILINE_MACRO_END

#define CROWDMOD_CHECK_VALUE(COND, MSG, ...) \
    CROWDMOD_ASSERT((COND), crowdmod::invalid_value, MSG, __VA_ARGS__)

#define CROWDMOD_THROW_MISSING_OBJECT(type, id, ...) \
    FC_THROW_EXCEPTION(crowdmod::missing_object, "Missing ${type} with id \"${id}\"", \
            ("type",type)("id",id) __VA_ARGS__)

#define CROWDMOD_THROW_OBJECT_ALREADY_EXIST(type, id, ...) \
    FC_THROW_EXCEPTION(crowdmod::object_already_exist, "Object ${type} with id \"${id}\" already exists", \
            ("type",type)("id",id) __VA_ARGS__)

#define CROWDMOD_CHECK_AUTHORITY(ACCOUNT, REQUIRED, ROLE) \
    CROWDMOD_ASSERT((ACCOUNT) == (REQUIRED), crowdmod::unauthorized, \
            "Account \"${account}\" is not the ${role}", \
            ("account",ACCOUNT)("required",REQUIRED)("role",ROLE))

#define CROWDMOD_THROW_INTERNAL_ERROR(MSG, ...) \
    FC_THROW_EXCEPTION(crowdmod::internal_error, MSG, __VA_ARGS__)

namespace crowdmod {

    // Function to get logic_error codes namespace
    template<typename T>
    std::string get_logic_error_namespace();

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        crowdmod_exception, fc::exception,
              0, "crowdmod base exception")

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        operation_exception, crowdmod_exception,
        1000000, "Operation exception");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        unsupported_operation, operation_exception,
        1010000, "Unsupported operation");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        parameter_exception, operation_exception,
        1020000, "Parameter exception");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        missing_object, parameter_exception,
        1020200, "Missing object");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        object_already_exist, parameter_exception,
        1020300, "Object already exist");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        invalid_parameter, parameter_exception,
        1020400, "Invalid parameter value");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        business_exception, crowdmod_exception,
        2000000, "Business logic error");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        insufficient_funds, business_exception,
        2020000, "Account does not have sufficient funds")

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        insufficient_allowance, business_exception,
        2020100, "Platform is not allowed to spend the required amount")

    class logic_exception : public business_exception {
        CROWDMOD_DECLARE_DERIVED_EXCEPTION_BODY(
            logic_exception, business_exception,
            2030000, "business logic error");
    public:
        enum error_types {
            // elimination test
            vote_quorum_not_met = 1,

            // harvest_likes operation
            net_likes_must_be_positive,
            content_is_eliminated,
            no_likes_to_harvest,

            // deletion operation
            content_is_not_eliminated,

            // withdraw operation
            nothing_to_withdraw,
        };
    };

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        unauthorized, business_exception,
        2040000, "Account is not authorized for this action");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        arithmetic_exception, crowdmod_exception,
        3000000, "arithmetic exception");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        division_by_zero, arithmetic_exception,
        3010000, "division by zero");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        arithmetic_overflow, arithmetic_exception,
        3020000, "arithmetic overflow");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        internal_error, crowdmod_exception,
        4000000, "internal error");

    CROWDMOD_DECLARE_DERIVED_EXCEPTION(
        invalid_value, internal_error,
        4020000, "invalid value exception");

} // crowdmod

FC_REFLECT_ENUM(crowdmod::logic_exception::error_types,
        (vote_quorum_not_met)

        // harvest_likes operation
        (net_likes_must_be_positive)
        (content_is_eliminated)
        (no_likes_to_harvest)

        // deletion operation
        (content_is_not_eliminated)

        // withdraw operation
        (nothing_to_withdraw)
);
