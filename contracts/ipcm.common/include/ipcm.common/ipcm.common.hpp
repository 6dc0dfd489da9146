#pragma once

#include <eosio/crypto.hpp>
#include <eosio/eosio.hpp>

#include <string>

namespace ipcm {

   using eosio::check;
   using eosio::checksum256;
   using eosio::name;
   using eosio::print;
   using std::string;

   static constexpr eosio::name active_permission{"active"_n};

   /**
    * Token ids are arbitrary strings, so string keyed tables index them
    * through the sha256 of the id.
    */
   inline checksum256 token_key( const string& token_id ) {
      return eosio::sha256( token_id.data(), token_id.size() );
   }

   // Finds the row of `token_id` in a "bytoken" secondary index.
   template<typename Index>
   auto find_token( const Index& idx, const string& token_id ) {
      const auto key = token_key( token_id );
      for( auto itr = idx.lower_bound( key ); itr != idx.end() && itr->by_token() == key; ++itr ) {
         if( itr->token_id == token_id ) {
            return itr;
         }
      }
      return idx.end();
   }

} // namespace ipcm
