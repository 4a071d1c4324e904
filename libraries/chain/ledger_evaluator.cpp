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
#include <artledger/chain/database.hpp>
#include <artledger/chain/ledger_evaluator.hpp>
#include <artledger/chain/ledger_objects.hpp>

#include <artledger/protocol/events.hpp>
#include <artledger/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace artledger {
   namespace chain {
      void_result mint_evaluator::do_evaluate(const mint_operation &op) {
         try {
            const database& d = db();

            // The caller was verified to be a real identity by validate()
            FC_ASSERT(d.next_token_id() < std::numeric_limits<token_id_type>::max(),
                      "Token identifiers are exhausted");

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      token_id_type mint_evaluator::do_apply(const mint_operation &op) {
         try {
            database &d = db();

            const token_object &token = d.create_token(op.caller);
            d.adjust_balance(op.caller, 1);
            d.push_applied_event(token_transferred_event(address(), op.caller, token.id));

            dlog("Minted token ${id} to ${owner}", ("id", token.id)("owner", op.caller));
            return token.id;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result approve_evaluator::do_evaluate(const approve_operation &op) {
         try {
            const database& d = db();

            // Verify the existence of the token
            const token_object &token = d.get_token(op.token_id);
            _token = &token;

            // The owner already controls the token and may not also be its delegate
            ARTLEDGER_ASSERT(op.to != token.owner, invalid_approval_exception,
                             "The owner of token ${id} may not be designated as its delegate",
                             ("id", op.token_id));

            // Verify that the caller is the owner or an operator of the owner
            const bool is_owner = (op.caller == token.owner);
            const bool is_operator = d.is_approved_for_all(token.owner, op.caller);
            ARTLEDGER_ASSERT(is_owner || is_operator, unauthorized_exception,
                             "${caller} is neither the owner of token ${id} nor an approved operator of ${owner}",
                             ("caller", op.caller)
                             ("id", op.token_id)
                             ("owner", token.owner));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result approve_evaluator::do_apply(const approve_operation &op) {
         try {
            database &d = db();

            const token_object &token = *_token;
            const address owner = token.owner;
            d.modify(token, [&op](token_object &obj) {
               obj.approved = op.to;
            });
            d.push_applied_event(token_approved_event(owner, op.to, op.token_id));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result set_approval_for_all_evaluator::do_evaluate(const set_approval_for_all_operation &op) {
         // Self-approval was rejected by validate(); operator approvals have no other precondition
         return void_result();
      }

      void_result set_approval_for_all_evaluator::do_apply(const set_approval_for_all_operation &op) {
         try {
            database &d = db();

            d.set_operator_approval(op.caller, op.approved_operator, op.approved);
            d.push_applied_event(approval_for_all_event(op.caller, op.approved_operator, op.approved));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result transfer_evaluator::do_evaluate(const transfer_operation &op) {
         try {
            const database& d = db();

            // Verify the existence of the token
            const token_object &token = d.get_token(op.token_id);
            _token = &token;

            // Verify that the caller is the owner, the delegate, or an operator of the owner
            const bool is_owner = (op.caller == token.owner);
            const bool is_delegate = token.is_delegate(op.caller);
            const bool is_operator = d.is_approved_for_all(token.owner, op.caller);
            ARTLEDGER_ASSERT(is_owner || is_delegate || is_operator, unauthorized_exception,
                             "${caller} is not authorized to transfer token ${id}",
                             ("caller", op.caller)
                             ("id", op.token_id));

            // Verify that the stated sender actually holds the token
            ARTLEDGER_ASSERT(token.owner == op.from, ownership_mismatch_exception,
                             "Token ${id} is owned by ${owner} rather than ${from}",
                             ("id", op.token_id)
                             ("owner", token.owner)
                             ("from", op.from));

            ARTLEDGER_ASSERT(!op.to.is_null(), invalid_address_exception,
                             "Token ${id} may not be transferred to the null address",
                             ("id", op.token_id));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result transfer_evaluator::do_apply(const transfer_operation &op) {
         try {
            database &d = db();

            // Every transfer clears the delegate
            d.modify(*_token, [&op](token_object &obj) {
               obj.approved = address();
               obj.owner = op.to;
            });

            d.adjust_balance(op.from, -1);
            d.adjust_balance(op.to, 1);

            d.push_applied_event(token_transferred_event(op.from, op.to, op.token_id));

            dlog("Transferred token ${id} from ${from} to ${to}",
                 ("id", op.token_id)("from", op.from)("to", op.to));
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result safe_transfer_evaluator::do_evaluate(const safe_transfer_operation &op) {
         try {
            return _transfer.do_evaluate(op.as_transfer());
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result safe_transfer_evaluator::do_apply(const safe_transfer_operation &op) {
         try {
            _transfer.do_apply(op.as_transfer());

            // Recipients without code accept unconditionally
            execution_host &host = db().host();
            if (!host.is_code_bearing(op.to)) {
               return void_result();
            }

            const receiver_ack ack = notify_recipient(host, op);
            const bool acknowledged = ack.call_succeeded && (ack.value == ARTLEDGER_RECEIVER_MAGIC);
            if (!acknowledged) {
               wlog("Recipient ${to} rejected token ${id} (call succeeded: ${ok}, returned: ${value})",
                    ("to", op.to)("id", op.token_id)("ok", ack.call_succeeded)("value", ack.value));
            }

            // Throwing here reverts the transfer applied above
            ARTLEDGER_ASSERT(acknowledged, receiver_rejected_exception,
                             "Recipient ${to} did not acknowledge receipt of token ${id}",
                             ("to", op.to)
                             ("id", op.token_id));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      receiver_ack notify_recipient(execution_host &host, const safe_transfer_operation &op) {
         try {
            return host.on_token_received(op.to, op.caller, op.token_id, op.data);
         } catch (const fc::exception &e) {
            wlog("Receipt callback of ${to} failed: ${e}", ("to", op.to)("e", e.to_detail_string()));
         } catch (const std::exception &e) {
            wlog("Receipt callback of ${to} failed: ${e}", ("to", op.to)("e", e.what()));
         }
         return receiver_ack();
      }

   } // namespace chain
} // namespace artledger
