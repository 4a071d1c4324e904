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

#include <artledger/chain/evaluator.hpp>
#include <artledger/chain/ledger_objects.hpp>
#include <artledger/protocol/execution_host.hpp>
#include <artledger/protocol/ledger_ops.hpp>

namespace artledger {
   namespace chain {
      using namespace artledger::protocol;

      class mint_evaluator : public evaluator<mint_evaluator> {
      public:
         typedef mint_operation operation_type;

         explicit mint_evaluator(database& d) : evaluator(d) {}

         void_result do_evaluate(const mint_operation &o);

         token_id_type do_apply(const mint_operation &o);
      };

      class approve_evaluator : public evaluator<approve_evaluator> {
      public:
         typedef approve_operation operation_type;

         explicit approve_evaluator(database& d) : evaluator(d) {}

         void_result do_evaluate(const approve_operation &o);

         void_result do_apply(const approve_operation &o);

         const token_object* _token = nullptr;
      };

      class set_approval_for_all_evaluator : public evaluator<set_approval_for_all_evaluator> {
      public:
         typedef set_approval_for_all_operation operation_type;

         explicit set_approval_for_all_evaluator(database& d) : evaluator(d) {}

         void_result do_evaluate(const set_approval_for_all_operation &o);

         void_result do_apply(const set_approval_for_all_operation &o);
      };

      class transfer_evaluator : public evaluator<transfer_evaluator> {
      public:
         typedef transfer_operation operation_type;

         explicit transfer_evaluator(database& d) : evaluator(d) {}

         void_result do_evaluate(const transfer_operation &o);

         void_result do_apply(const transfer_operation &o);

         const token_object* _token = nullptr;
      };

      class safe_transfer_evaluator : public evaluator<safe_transfer_evaluator> {
      public:
         typedef safe_transfer_operation operation_type;

         explicit safe_transfer_evaluator(database& d) : evaluator(d), _transfer(d) {}

         void_result do_evaluate(const safe_transfer_operation &o);

         /// Applies the transfer, then requires a code-bearing recipient to acknowledge it
         void_result do_apply(const safe_transfer_operation &o);

         transfer_evaluator _transfer;
      };

      /**
       * Call the receipt callback of a code-bearing recipient
       * @param host Execution host
       * @param op Safe transfer being applied
       * @return The recipient's acknowledgement; a failed call is reported rather than thrown
       */
      receiver_ack notify_recipient(execution_host& host, const safe_transfer_operation& op);

   } // namespace chain
} // namespace artledger
