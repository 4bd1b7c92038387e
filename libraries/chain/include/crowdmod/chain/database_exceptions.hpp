#pragma once

#include <crowdmod/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

#define CROWDMOD_TRY_NOTIFY(signal, ...)                                      \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const crowdmod::chain::plugin_exception& e )                        \
   {                                                                          \
      elog( "Caught plugin exception: ${e}", ("e", e.to_detail_string() ) );  \
      throw;                                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in plugin: ${e}", ("e", e.to_detail_string() ) ); \
   }                                                                          \
   catch( const std::exception& e )                                           \
   {                                                                          \
      wlog( "Caught unexpected exception in plugin: ${e}", ("e", e.what()) ); \
   }

namespace crowdmod { namespace chain {

    FC_DECLARE_EXCEPTION(chain_exception, 5000000, "ledger exception")

    FC_DECLARE_DERIVED_EXCEPTION(plugin_exception, crowdmod::chain::chain_exception, 5100000, "plugin exception")

} } // crowdmod::chain
