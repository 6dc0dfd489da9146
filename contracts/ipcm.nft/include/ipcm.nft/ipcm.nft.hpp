#pragma once

#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <ipcm.common/ipcm.common.hpp>
#include <ipcm.registry/ipcm.registry.hpp>

#include <string>
#include <vector>

namespace ipcm {

   struct [[eosio::table("state"), eosio::contract("ipcm.nft")]] nft_state {
      name     admin;
      name     mapping_registry;

      EOSLIB_SERIALIZE( nft_state, (admin)(mapping_registry) )
   };

   struct [[eosio::table("tokens"), eosio::contract("ipcm.nft")]] token {
      uint64_t    id;
      string      token_id;
      name        holder;

      uint64_t    primary_key()const { return id; }
      checksum256 by_token()const    { return token_key( token_id ); }

      EOSLIB_SERIALIZE( token, (id)(token_id)(holder) )
   };

   /**
    *  Every holder has a scope listing the token ids it holds. Primary keys
    *  only grow inside a scope, so table order is the order the tokens were
    *  received in.
    */
   struct [[eosio::table("holdings"), eosio::contract("ipcm.nft")]] holding {
      uint64_t    id;
      string      token_id;

      uint64_t    primary_key()const { return id; }
      checksum256 by_token()const    { return token_key( token_id ); }

      EOSLIB_SERIALIZE( holding, (id)(token_id) )
   };

   // shares its primary key with the token row
   struct [[eosio::table("ipcmrefs"), eosio::contract("ipcm.nft")]] ipcm_ref {
      uint64_t    id;
      string      token_id;
      string      ipcm_key;

      uint64_t    primary_key()const { return id; }

      EOSLIB_SERIALIZE( ipcm_ref, (id)(token_id)(ipcm_key) )
   };

   typedef eosio::singleton< "state"_n, nft_state >   nft_state_singleton;

   typedef eosio::multi_index< "tokens"_n, token,
      indexed_by< "bytoken"_n, const_mem_fun< token, checksum256, &token::by_token > >
   > tokens_table;

   typedef eosio::multi_index< "holdings"_n, holding,
      indexed_by< "bytoken"_n, const_mem_fun< holding, checksum256, &holding::by_token > >
   > holdings_table;

   typedef eosio::multi_index< "ipcmrefs"_n, ipcm_ref > ipcmrefs_table;

   class [[eosio::contract("ipcm.nft")]] nft : public eosio::contract {
      public:

         using contract::contract;

         [[eosio::action]]
         void init( name admin, name mapping_registry );

         [[eosio::action]]
         void mint( name caller, string token_id, name holder, string ipcm_key );

         [[eosio::action]]
         void transfer( name caller, string token_id, name to );

         [[eosio::action]]
         void burn( name caller, string token_id );

         [[eosio::action]]
         void ownerof( string token_id );

         [[eosio::action]]
         void getipcmkey( string token_id );

         [[eosio::action]]
         void tokensof( name holder );

         [[eosio::action]]
         void resolvecid( string token_id );

         [[eosio::action]]
         void logmint( string token_id, name holder, string ipcm_key );

         [[eosio::action]]
         void logtransfer( string token_id, name from, name to );

         [[eosio::action]]
         void logburn( string token_id, name holder );

         static name owner_of( name nft_account, const string& token_id )
         {
            tokens_table tokens( nft_account, nft_account.value );
            auto bytoken = tokens.get_index<"bytoken"_n>();
            auto itr = find_token( bytoken, token_id );
            check( itr != bytoken.end(), "token does not exist" );
            return itr->holder;
         }

         static string get_ipcm_key( name nft_account, const string& token_id )
         {
            tokens_table tokens( nft_account, nft_account.value );
            auto bytoken = tokens.get_index<"bytoken"_n>();
            auto itr = find_token( bytoken, token_id );
            check( itr != bytoken.end(), "token does not exist" );

            ipcmrefs_table refs( nft_account, nft_account.value );
            const auto& ref = refs.get( itr->id, "token does not exist" );
            return ref.ipcm_key;
         }

         static std::vector<string> tokens_of( name nft_account, name holder )
         {
            std::vector<string> token_ids;
            holdings_table holdings( nft_account, holder.value );
            for( const auto& h : holdings ) {
               token_ids.push_back( h.token_id );
            }
            return token_ids;
         }

         static name get_mapping_registry( name nft_account )
         {
            nft_state_singleton state( nft_account, nft_account.value );
            check( state.exists(), "registry is not initialized" );
            return state.get().mapping_registry;
         }

         /**
          * Current cid of a token, read from the mapping registry's tables
          * under the token's ipcm key. Empty when the key was never mapped.
          */
         static string resolve_cid( name nft_account, const string& token_id )
         {
            const auto key = get_ipcm_key( nft_account, token_id );
            return registry::get_mapping( get_mapping_registry( nft_account ), key );
         }

      private:

         nft_state require_admin( name caller );
         token require_holder( name caller, const string& token_id );

         void add_holding( name holder, const string& token_id );
         void remove_holding( name holder, const string& token_id );
   };

} // namespace ipcm
