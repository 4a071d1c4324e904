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

#include <fc/crypto/sha256.hpp>
#include <fc/time.hpp>

#include <artledger/protocol/types.hpp>

namespace artledger {
   namespace protocol {
      /**
       * @brief Ambient entropy of the most recent block
       *
       * Metadata derived from this snapshot is reproducible only while the snapshot is unchanged.
       */
      struct block_entropy {
         fc::sha256 block_id;
         fc::time_point_sec timestamp;
      };

      /// Outcome of the synchronous call into a recipient during a safe transfer
      struct receiver_ack {
         /// False when the call itself failed
         bool call_succeeded = false;

         /// Value returned by the recipient; only meaningful when the call succeeded
         uint32_t value = 0;
      };

      /**
       * @brief Capabilities supplied by the environment that executes the ledger
       */
      class execution_host {
      public:
         virtual ~execution_host() {}

         /// Hash and timestamp of the most recent block
         virtual block_entropy current_entropy() const = 0;

         /// Whether the identity carries code that must acknowledge safe transfers
         virtual bool is_code_bearing(const address& who) const = 0;

         /**
          * Invoke the receipt callback of a code-bearing recipient
          * @param recipient Code-bearing identity receiving the token
          * @param op_account Identity that initiated the transfer
          * @param token_id Token being received
          * @param data Opaque payload of the transfer
          */
         virtual receiver_ack on_token_received(const address& recipient, const address& op_account,
                                                token_id_type token_id, const vector<char>& data) = 0;
      };
   }
}

FC_REFLECT( artledger::protocol::block_entropy, (block_id)(timestamp) )
FC_REFLECT( artledger::protocol::receiver_ack, (call_succeeded)(value) )
