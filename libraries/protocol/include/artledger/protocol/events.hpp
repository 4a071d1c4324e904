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
      /// Ownership change; @ref from is the null address for a mint
      struct token_transferred_event {
         token_transferred_event() {}
         token_transferred_event(const address& f, const address& t, token_id_type id)
            : from(f), to(t), token_id(id) {}

         address from;
         address to;
         token_id_type token_id = 0;
      };

      /// Delegate designated for a single token
      struct token_approved_event {
         token_approved_event() {}
         token_approved_event(const address& o, const address& a, token_id_type id)
            : owner(o), approved(a), token_id(id) {}

         address owner;
         address approved;
         token_id_type token_id = 0;
      };

      /// Operator approval granted or revoked for every token of an owner
      struct approval_for_all_event {
         approval_for_all_event() {}
         approval_for_all_event(const address& o, const address& op, bool a)
            : owner(o), approved_operator(op), approved(a) {}

         address owner;
         address approved_operator;
         bool approved = false;
      };

      typedef fc::static_variant<
         token_transferred_event,
         token_approved_event,
         approval_for_all_event
      > ledger_event;
   }
}

FC_REFLECT( artledger::protocol::token_transferred_event, (from)(to)(token_id) )
FC_REFLECT( artledger::protocol::token_approved_event, (owner)(approved)(token_id) )
FC_REFLECT( artledger::protocol::approval_for_all_event, (owner)(approved_operator)(approved) )
