#include <ipcm.registry/ipcm.registry.hpp>

namespace ipcm {

   void registry::init( name owner )
   {
      require_auth( get_self() );

      registry_state_singleton state( get_self(), get_self().value );
      check( !state.exists(), "registry already initialized" );
      check( is_account( owner ), "owner account does not exist" );

      registry_state st;
      st.owner = owner;
      state.set( st, get_self() );

      registry_params_singleton params( get_self(), get_self().value );
      params.set( registry_params{}, get_self() );
   }

   void registry::updatemap( name caller, string token_id, string cid )
   {
      require_owner( caller );

      mappings_table mappings( get_self(), get_self().value );
      auto bytoken = mappings.get_index<"bytoken"_n>();
      auto itr = find_token( bytoken, token_id );

      string   old_cid;
      uint64_t revision = 1;
      if( itr == bytoken.end() ) {
         mappings.emplace( get_self(), [&]( auto& m ) {
            m.id       = mappings.available_primary_key();
            m.token_id = token_id;
            m.cid      = cid;
            m.revision = revision;
         });
      } else {
         old_cid  = itr->cid;
         revision = itr->revision + 1;
         mappings.modify( *itr, eosio::same_payer, [&]( auto& m ) {
            m.cid      = cid;
            m.revision = revision;
         });
      }

      registry_params_singleton params( get_self(), get_self().value );
      if( params.get_or_default().keep_history ) {
         history_table history( get_self(), get_self().value );
         history.emplace( get_self(), [&]( auto& h ) {
            h.id         = history.available_primary_key();
            h.token_id   = token_id;
            h.revision   = revision;
            h.old_cid    = old_cid;
            h.new_cid    = cid;
            h.editor     = caller;
            h.updated_at = time_point_sec( eosio::current_time_point() );
         });
      }

      SEND_INLINE_ACTION( *this, logupdate, { {get_self(), active_permission} },
                          { token_id, old_cid, cid, caller } );
   }

   void registry::transferown( name caller, name new_owner )
   {
      const auto old = require_owner( caller );
      check( is_account( new_owner ), "new owner account does not exist" );

      registry_state_singleton state( get_self(), get_self().value );
      registry_state st;
      st.owner = new_owner;
      state.set( st, get_self() );

      SEND_INLINE_ACTION( *this, logownerxfr, { {get_self(), active_permission} },
                          { old.owner, new_owner } );
   }

   void registry::setparams( name caller, bool keep_history )
   {
      require_owner( caller );

      registry_params_singleton params( get_self(), get_self().value );
      auto p = params.get_or_default();
      p.keep_history = keep_history;
      params.set( p, get_self() );

      SEND_INLINE_ACTION( *this, logparams, { {get_self(), active_permission} },
                          { caller, keep_history } );
   }

   void registry::getmapping( string token_id )
   {
      print( get_mapping( get_self(), token_id ) );
   }

   void registry::getrevision( string token_id, uint64_t revision )
   {
      print( get_revision( get_self(), token_id, revision ).new_cid );
   }

   void registry::logupdate( string token_id, string old_cid, string new_cid, name editor )
   {
      require_auth( get_self() );
   }

   void registry::logownerxfr( name old_owner, name new_owner )
   {
      require_auth( get_self() );
   }

   void registry::logparams( name editor, bool keep_history )
   {
      require_auth( get_self() );
   }

   registry_state registry::require_owner( name caller )
   {
      registry_state_singleton state( get_self(), get_self().value );
      check( state.exists(), "registry is not initialized" );

      const auto st = state.get();
      check( caller == st.owner, "caller is not the registry owner" );
      require_auth( caller );
      return st;
   }

} // namespace ipcm

EOSIO_DISPATCH( ipcm::registry, (init)(updatemap)(transferown)(setparams)(getmapping)(getrevision)
                (logupdate)(logownerxfr)(logparams) )
