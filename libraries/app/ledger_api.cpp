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
#include <artledger/app/ledger_api.hpp>

namespace artledger {
   namespace app {
      using namespace artledger::protocol;

      ledger_api::ledger_api(chain::database& db) : _db(db) {
      }

      token_id_type ledger_api::mint(const address& caller) {
         mint_operation op;
         op.caller = caller;
         return _db.push_operation(op).get<token_id_type>();
      }

      uint64_t ledger_api::balance_of(const address& owner) const {
         return _db.balance_of(owner);
      }

      address ledger_api::owner_of(token_id_type token_id) const {
         return _db.owner_of(token_id);
      }

      address ledger_api::get_approved(token_id_type token_id) const {
         return _db.get_approved(token_id);
      }

      bool ledger_api::is_approved_for_all(const address& owner, const address& approved_operator) const {
         return _db.is_approved_for_all(owner, approved_operator);
      }

      void ledger_api::approve(const address& caller, const address& to, token_id_type token_id) {
         approve_operation op;
         op.caller = caller;
         op.to = to;
         op.token_id = token_id;
         _db.push_operation(op);
      }

      void ledger_api::set_approval_for_all(const address& caller, const address& approved_operator,
                                            bool approved) {
         set_approval_for_all_operation op;
         op.caller = caller;
         op.approved_operator = approved_operator;
         op.approved = approved;
         _db.push_operation(op);
      }

      void ledger_api::transfer_from(const address& caller, const address& from, const address& to,
                                     token_id_type token_id) {
         transfer_operation op;
         op.caller = caller;
         op.from = from;
         op.to = to;
         op.token_id = token_id;
         _db.push_operation(op);
      }

      void ledger_api::safe_transfer_from(const address& caller, const address& from, const address& to,
                                          token_id_type token_id) {
         safe_transfer_from(caller, from, to, token_id, vector<char>());
      }

      void ledger_api::safe_transfer_from(const address& caller, const address& from, const address& to,
                                          token_id_type token_id, const vector<char>& data) {
         safe_transfer_operation op;
         op.caller = caller;
         op.from = from;
         op.to = to;
         op.token_id = token_id;
         op.data = data;
         _db.push_operation(op);
      }

      string ledger_api::token_uri(token_id_type token_id) const {
         return _db.token_uri(token_id);
      }

      uint64_t ledger_api::total_supply() const {
         return _db.total_supply();
      }

      string ledger_api::name() const {
         return _db.get_properties().name;
      }

      string ledger_api::symbol() const {
         return _db.get_properties().symbol;
      }

      bool ledger_api::supports_interface(uint32_t interface_id) const {
         return _db.supports_interface(interface_id);
      }

      vector<token_id_type> ledger_api::tokens_of_owner(const address& owner) const {
         return _db.tokens_of_owner(owner);
      }
   }
}
