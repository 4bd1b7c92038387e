#pragma once

#include <crowdmod/protocol/operations.hpp>

namespace crowdmod { namespace chain {

    class database;

    template<typename OperationType = crowdmod::protocol::operation>
    class evaluator {
    public:
        virtual ~evaluator() = default;

        virtual void apply(const OperationType& op) = 0;

        virtual int get_type() const = 0;
    };

    template<typename EvaluatorType, typename OperationType = crowdmod::protocol::operation>
    class evaluator_impl : public evaluator<OperationType> {
    public:
        evaluator_impl(database& d)
                : _db(d) {
        }

        virtual void apply(const OperationType& o) final override {
            auto* eval = static_cast<EvaluatorType*>(this);
            const auto& op = o.template get<typename EvaluatorType::operation_type>();
            eval->do_apply(op);
        }

        virtual int get_type() const override {
            return OperationType::template tag<typename EvaluatorType::operation_type>::value;
        }

    protected:
        database& _db;
    };

} } // crowdmod::chain

#define DEFINE_EVALUATOR(X) \
class X ## _evaluator : public crowdmod::chain::evaluator_impl< X ## _evaluator > \
{                                                                           \
   public:                                                                  \
      typedef X ## _operation operation_type;                               \
                                                                            \
      X ## _evaluator( database& db )                                       \
         : crowdmod::chain::evaluator_impl< X ## _evaluator >( db )         \
      {}                                                                    \
                                                                            \
      void do_apply( const X ## _operation& o );                            \
};
