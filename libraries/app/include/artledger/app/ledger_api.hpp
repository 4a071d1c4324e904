/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <artledger/chain/database.hpp>

namespace artledger {
   namespace app {
      using protocol::address;
      using protocol::token_id_type;
      using std::string;
      using std::vector;

      /**
       * @brief The public interface of the ledger
       *
       * Mutating calls take the caller identity supplied by the execution host and throw on
       * failure, leaving the ledger unchanged.
       */
      class ledger_api {
      public:
         explicit ledger_api(chain::database& db);

         /**
          * @brief Mint the next token to the caller
          * @return ID of the new token
          */
         token_id_type mint(const address& caller);

         /// @throws invalid_address_exception for the null address
         uint64_t balance_of(const address& owner) const;

         /// @throws token_not_found_exception
         address owner_of(token_id_type token_id) const;

         /// @throws token_not_found_exception
         address get_approved(token_id_type token_id) const;

         bool is_approved_for_all(const address& owner, const address& approved_operator) const;

         void approve(const address& caller, const address& to, token_id_type token_id);

         void set_approval_for_all(const address& caller, const address& approved_operator, bool approved);

         void transfer_from(const address& caller, const address& from, const address& to,
                            token_id_type token_id);

         void safe_transfer_from(const address& caller, const address& from, const address& to,
                                 token_id_type token_id);

         void safe_transfer_from(const address& caller, const address& from, const address& to,
                                 token_id_type token_id, const vector<char>& data);

         /// Metadata of a minted token, recomputed on every call
         string token_uri(token_id_type token_id) const;

         uint64_t total_supply() const;

         string name() const;

         string symbol() const;

         bool supports_interface(uint32_t interface_id) const;

         vector<token_id_type> tokens_of_owner(const address& owner) const;

      private:
         chain::database& _db;
      };
   }
}
