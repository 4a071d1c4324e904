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

#include <fc/static_variant.hpp>

#include <artledger/protocol/types.hpp>

namespace artledger {
   namespace protocol {
      struct mint_operation {
         /// Identity requesting the mint; becomes the owner of the new token
         address caller;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;
      };

      struct approve_operation {
         /// This identity must be the owner of the token or an operator of the owner
         address caller;

         /// Delegate to designate; the null address clears the delegate
         address to;

         /// Token whose delegate is being set
         token_id_type token_id = 0;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;
      };

      struct set_approval_for_all_operation {
         /// Owner granting or revoking the approval
         address caller;

         /// Identity that may act on every token of the caller
         address approved_operator;

         bool approved = false;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;
      };

      struct transfer_operation {
         /// Owner, delegate of the token, or an operator of the owner
         address caller;

         /// Expected current owner of the token
         address from;

         /// Recipient of the token
         address to;

         token_id_type token_id = 0;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;
      };

      /**
       * @brief A transfer that additionally requires a code-bearing recipient to acknowledge receipt
       */
      struct safe_transfer_operation {
         address caller;
         address from;
         address to;
         token_id_type token_id = 0;

         /// Opaque payload forwarded to the recipient
         vector<char> data;

         void validate() const;

         transfer_operation as_transfer() const;
      };

      typedef fc::static_variant<
         mint_operation,
         approve_operation,
         set_approval_for_all_operation,
         transfer_operation,
         safe_transfer_operation
      > operation;

      typedef fc::static_variant<
         void_result,
         token_id_type
      > operation_result;

      /**
       * Performs the stateless validation of any operation
       */
      struct operation_validator {
         typedef void result_type;

         template<typename T>
         void operator()(const T& o) const { o.validate(); }
      };

      void validate_operation(const operation& op);
   }
}

FC_REFLECT( artledger::protocol::mint_operation, (caller) )

FC_REFLECT( artledger::protocol::approve_operation, (caller)(to)(token_id) )

FC_REFLECT( artledger::protocol::set_approval_for_all_operation, (caller)(approved_operator)(approved) )

FC_REFLECT( artledger::protocol::transfer_operation, (caller)(from)(to)(token_id) )

FC_REFLECT( artledger::protocol::safe_transfer_operation, (caller)(from)(to)(token_id)(data) )
