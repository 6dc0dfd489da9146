#pragma once

#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <ipcm.common/ipcm.common.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace ipcm {

   using eosio::const_mem_fun;
   using eosio::indexed_by;
   using eosio::time_point_sec;

   struct [[eosio::table("state"), eosio::contract("ipcm.registry")]] registry_state {
      name     owner;

      EOSLIB_SERIALIZE( registry_state, (owner) )
   };

   struct [[eosio::table("params"), eosio::contract("ipcm.registry")]] registry_params {
      bool     keep_history = true;

      EOSLIB_SERIALIZE( registry_params, (keep_history) )
   };

   // current cid of a token id
   struct [[eosio::table("mappings"), eosio::contract("ipcm.registry")]] cid_mapping {
      uint64_t    id;
      string      token_id;
      string      cid;
      uint64_t    revision = 0;

      uint64_t    primary_key()const { return id; }
      checksum256 by_token()const    { return token_key( token_id ); }

      EOSLIB_SERIALIZE( cid_mapping, (id)(token_id)(cid)(revision) )
   };

   // append-only, one row per applied update
   struct [[eosio::table("history"), eosio::contract("ipcm.registry")]] cid_revision {
      uint64_t        id;
      string          token_id;
      uint64_t        revision;
      string          old_cid;
      string          new_cid;
      name            editor;
      time_point_sec  updated_at;

      uint64_t    primary_key()const { return id; }
      checksum256 by_token()const    { return token_key( token_id ); }

      EOSLIB_SERIALIZE( cid_revision, (id)(token_id)(revision)(old_cid)(new_cid)(editor)(updated_at) )
   };

   typedef eosio::singleton< "state"_n, registry_state >     registry_state_singleton;
   typedef eosio::singleton< "params"_n, registry_params >   registry_params_singleton;

   typedef eosio::multi_index< "mappings"_n, cid_mapping,
      indexed_by< "bytoken"_n, const_mem_fun< cid_mapping, checksum256, &cid_mapping::by_token > >
   > mappings_table;

   typedef eosio::multi_index< "history"_n, cid_revision,
      indexed_by< "bytoken"_n, const_mem_fun< cid_revision, checksum256, &cid_revision::by_token > >
   > history_table;

   /**
    * Mutable pointer from a token id to a content hash. Only the registry
    * owner may move a pointer, and every move is published through
    * `logupdate` together with the value it replaced.
    */
   class [[eosio::contract("ipcm.registry")]] registry : public eosio::contract {
      public:

         using contract::contract;

         [[eosio::action]]
         void init( name owner );

         [[eosio::action]]
         void updatemap( name caller, string token_id, string cid );

         [[eosio::action]]
         void transferown( name caller, name new_owner );

         [[eosio::action]]
         void setparams( name caller, bool keep_history );

         [[eosio::action]]
         void getmapping( string token_id );

         [[eosio::action]]
         void getrevision( string token_id, uint64_t revision );

         [[eosio::action]]
         void logupdate( string token_id, string old_cid, string new_cid, name editor );

         [[eosio::action]]
         void logownerxfr( name old_owner, name new_owner );

         [[eosio::action]]
         void logparams( name editor, bool keep_history );

         // returns "" for a token id that was never mapped
         static string get_mapping( name registry_account, const string& token_id )
         {
            mappings_table mappings( registry_account, registry_account.value );
            auto bytoken = mappings.get_index<"bytoken"_n>();
            auto itr = find_token( bytoken, token_id );
            return itr == bytoken.end() ? string() : itr->cid;
         }

         // logged revisions of a token id, oldest first
         static std::vector<cid_revision> get_history( name registry_account, const string& token_id )
         {
            std::vector<cid_revision> revisions;
            history_table history( registry_account, registry_account.value );
            auto bytoken = history.get_index<"bytoken"_n>();
            const auto key = token_key( token_id );
            for( auto itr = bytoken.lower_bound( key ); itr != bytoken.end() && itr->by_token() == key; ++itr ) {
               if( itr->token_id == token_id ) {
                  revisions.push_back( *itr );
               }
            }
            return revisions;
         }

         static cid_revision get_revision( name registry_account, const string& token_id, uint64_t revision )
         {
            const auto revisions = get_history( registry_account, token_id );
            auto itr = std::find_if( revisions.begin(), revisions.end(), [&]( const auto& r ) {
               return r.revision == revision;
            });
            check( itr != revisions.end(), "revision does not exist" );
            return *itr;
         }

      private:

         registry_state require_owner( name caller );
   };

} // namespace ipcm
