#include <ipcm.nft/ipcm.nft.hpp>

namespace ipcm {

   void nft::init( name admin, name mapping_registry )
   {
      require_auth( get_self() );

      nft_state_singleton state( get_self(), get_self().value );
      check( !state.exists(), "registry already initialized" );
      check( is_account( admin ), "admin account does not exist" );
      check( is_account( mapping_registry ), "mapping registry account does not exist" );

      nft_state st;
      st.admin            = admin;
      st.mapping_registry = mapping_registry;
      state.set( st, get_self() );
   }

   void nft::mint( name caller, string token_id, name holder, string ipcm_key )
   {
      require_admin( caller );

      tokens_table tokens( get_self(), get_self().value );
      auto bytoken = tokens.get_index<"bytoken"_n>();
      check( find_token( bytoken, token_id ) == bytoken.end(), "token already exists" );
      check( is_account( holder ), "holder account does not exist" );

      const uint64_t id = tokens.available_primary_key();
      tokens.emplace( get_self(), [&]( auto& t ) {
         t.id       = id;
         t.token_id = token_id;
         t.holder   = holder;
      });

      add_holding( holder, token_id );

      ipcmrefs_table refs( get_self(), get_self().value );
      refs.emplace( get_self(), [&]( auto& r ) {
         r.id       = id;
         r.token_id = token_id;
         r.ipcm_key = ipcm_key;
      });

      SEND_INLINE_ACTION( *this, logmint, { {get_self(), active_permission} },
                          { token_id, holder, ipcm_key } );
   }

   void nft::transfer( name caller, string token_id, name to )
   {
      const auto tok = require_holder( caller, token_id );
      check( is_account( to ), "to account does not exist" );

      remove_holding( tok.holder, token_id );
      add_holding( to, token_id );

      tokens_table tokens( get_self(), get_self().value );
      tokens.modify( tokens.get( tok.id ), eosio::same_payer, [&]( auto& t ) {
         t.holder = to;
      });

      SEND_INLINE_ACTION( *this, logtransfer, { {get_self(), active_permission} },
                          { token_id, tok.holder, to } );
   }

   void nft::burn( name caller, string token_id )
   {
      const auto tok = require_holder( caller, token_id );

      tokens_table tokens( get_self(), get_self().value );
      ipcmrefs_table refs( get_self(), get_self().value );
      const auto& row = tokens.get( tok.id, "token does not exist" );
      const auto& ref = refs.get( tok.id, "ipcm reference missing for token" );

      remove_holding( tok.holder, token_id );
      tokens.erase( row );
      refs.erase( ref );

      SEND_INLINE_ACTION( *this, logburn, { {get_self(), active_permission} },
                          { token_id, tok.holder } );
   }

   void nft::ownerof( string token_id )
   {
      print( owner_of( get_self(), token_id ).to_string() );
   }

   void nft::getipcmkey( string token_id )
   {
      print( get_ipcm_key( get_self(), token_id ) );
   }

   void nft::tokensof( name holder )
   {
      const auto token_ids = tokens_of( get_self(), holder );
      for( size_t i = 0; i < token_ids.size(); ++i ) {
         if( i > 0 ) print( "," );
         print( token_ids[i] );
      }
   }

   void nft::resolvecid( string token_id )
   {
      print( resolve_cid( get_self(), token_id ) );
   }

   void nft::logmint( string token_id, name holder, string ipcm_key )
   {
      require_auth( get_self() );
   }

   void nft::logtransfer( string token_id, name from, name to )
   {
      require_auth( get_self() );
   }

   void nft::logburn( string token_id, name holder )
   {
      require_auth( get_self() );
   }

   nft_state nft::require_admin( name caller )
   {
      nft_state_singleton state( get_self(), get_self().value );
      check( state.exists(), "registry is not initialized" );

      const auto st = state.get();
      check( caller == st.admin, "caller is not the registry admin" );
      require_auth( caller );
      return st;
   }

   token nft::require_holder( name caller, const string& token_id )
   {
      nft_state_singleton state( get_self(), get_self().value );
      check( state.exists(), "registry is not initialized" );

      tokens_table tokens( get_self(), get_self().value );
      auto bytoken = tokens.get_index<"bytoken"_n>();
      auto itr = find_token( bytoken, token_id );
      check( itr != bytoken.end(), "token does not exist" );
      check( itr->holder == caller, "caller does not own this token" );
      require_auth( caller );
      return *itr;
   }

   void nft::add_holding( name holder, const string& token_id )
   {
      holdings_table holdings( get_self(), holder.value );
      holdings.emplace( get_self(), [&]( auto& h ) {
         h.id       = holdings.available_primary_key();
         h.token_id = token_id;
      });
   }

   void nft::remove_holding( name holder, const string& token_id )
   {
      holdings_table holdings( get_self(), holder.value );
      auto bytoken = holdings.get_index<"bytoken"_n>();
      auto itr = find_token( bytoken, token_id );
      check( itr != bytoken.end(), "holding missing for token" );
      holdings.erase( *itr );
   }

} // namespace ipcm

EOSIO_DISPATCH( ipcm::nft, (init)(mint)(transfer)(burn)(ownerof)(getipcmkey)(tokensof)(resolvecid)
                (logmint)(logtransfer)(logburn) )
