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

#include <artledger/protocol/types.hpp>

#include <fc/time.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

/**
 * @defgroup ledger Ownership ledger objects
 */

namespace artledger {
   namespace chain {
      using namespace boost::multi_index;
      using protocol::address;
      using protocol::token_id_type;

      /**
       *  @brief Tracks a minted token
       *  @ingroup ledger
       *
       *  Tokens are never destroyed; every ID below the next token ID has exactly one of these.
       */
      class token_object {
      public:
         token_id_type id = 0;

         /// Never the null address once minted
         address owner;

         /// Delegate permitted to transfer this token; null when none is designated
         address approved;

         /// Block time at which the token was minted
         fc::time_point_sec minted;

         bool has_delegate() const;

         /// True only when a delegate is designated and equals @p who
         bool is_delegate(const address& who) const;
      };

      struct by_id;
      struct by_owner;
      typedef multi_index_container<
         token_object,
         indexed_by<
            ordered_unique< tag<by_id>, member<token_object, token_id_type, &token_object::id> >,
            ordered_unique< tag<by_owner>,
               composite_key<token_object,
                  member<token_object, address, &token_object::owner>,
                  member<token_object, token_id_type, &token_object::id>
               >
            >
         >
      > token_index;


      /**
       *  @brief Count of tokens held by an owner
       *  @ingroup ledger
       *
       *  The sum of every count equals the number of minted tokens.
       */
      class balance_object {
      public:
         address owner;
         uint64_t count = 0;
      };

      typedef multi_index_container<
         balance_object,
         indexed_by<
            ordered_unique< tag<by_owner>, member<balance_object, address, &balance_object::owner> >
         >
      > balance_index;


      /**
       *  @brief Owner-controlled approval of an operator for all of the owner's tokens
       *  @ingroup ledger
       */
      class operator_approval_object {
      public:
         address owner;
         address approved_operator;
         bool approved = false;
      };

      struct by_owner_operator;
      typedef multi_index_container<
         operator_approval_object,
         indexed_by<
            ordered_unique< tag<by_owner_operator>,
               composite_key<operator_approval_object,
                  member<operator_approval_object, address, &operator_approval_object::owner>,
                  member<operator_approval_object, address, &operator_approval_object::approved_operator>
               >
            >
         >
      > operator_approval_index;
   }
} // artledger::chain

FC_REFLECT( artledger::chain::token_object,
            (id)
            (owner)
            (approved)
            (minted)
          )

FC_REFLECT( artledger::chain::balance_object, (owner)(count) )

FC_REFLECT( artledger::chain::operator_approval_object, (owner)(approved_operator)(approved) )
