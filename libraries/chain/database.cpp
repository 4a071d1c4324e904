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

#include <artledger/metadata/token_metadata.hpp>

#include <artledger/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace artledger {
   namespace chain {
      namespace {
         struct applying_guard {
            explicit applying_guard(bool& flag) : _flag(flag) { _flag = true; }
            ~applying_guard() { _flag = false; }
            bool& _flag;
         };
      }

      database::database(const ledger_properties& props, protocol::execution_host& host)
         : _props(props), _host(host) {
         FC_ASSERT(!_props.ledger_address.is_null(), "The ledger address should not be the null address");
         initialize_evaluators();
      }

      database::~database() {
      }

      template<typename EvaluatorType>
      void database::register_evaluator() {
         const auto which = operation::tag<typename EvaluatorType::operation_type>::value;
         const size_t slot = static_cast<size_t>(which);
         if (_operation_evaluators.size() <= slot) {
            _operation_evaluators.resize(slot + 1);
         }
         _operation_evaluators[slot] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
      }

      void database::initialize_evaluators() {
         register_evaluator<mint_evaluator>();
         register_evaluator<approve_evaluator>();
         register_evaluator<set_approval_for_all_evaluator>();
         register_evaluator<transfer_evaluator>();
         register_evaluator<safe_transfer_evaluator>();
      }

      operation_result database::push_operation(const operation& op) {
         try {
            // A recipient callback may query the ledger but may not mutate it mid-operation
            FC_ASSERT(!_applying_operation, "Ledger operations may not be nested");
            protocol::validate_operation(op);

            operation_result result;
            {
               applying_guard guard(_applying_operation);
               undo_session session(*this);
               result = apply_operation(op);
               session.commit();
            }

            publish_applied_events();
            return result;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      operation_result database::apply_operation(const operation& op) {
         const auto i_which = op.which();
         FC_ASSERT(i_which >= 0 && static_cast<size_t>(i_which) < _operation_evaluators.size(),
                   "No registered evaluator for this operation");
         const std::unique_ptr<op_evaluator>& eval = _operation_evaluators[static_cast<size_t>(i_which)];
         FC_ASSERT(eval, "No registered evaluator for this operation");
         return eval->evaluate(*this, op);
      }

      void database::publish_applied_events() {
         _applied_events.clear();
         _applied_events.swap(_pending_events);

         // Subscribers observe committed state; they may query the ledger but not mutate it
         applying_guard guard(_applying_operation);
         const vector<ledger_event> committed = _applied_events;
         for (const ledger_event& e : committed) {
            try {
               applied_event(e);
            } catch (const fc::exception& ex) {
               wlog("Subscriber failed on applied event: ${e}", ("e", ex.to_detail_string()));
            } catch (const std::exception& ex) {
               wlog("Subscriber failed on applied event: ${e}", ("e", ex.what()));
            }
         }
      }

      uint64_t database::balance_of(const address& owner) const {
         ARTLEDGER_ASSERT(!owner.is_null(), invalid_address_exception,
                          "The balance of the null address is undefined");
         const auto& idx = _balances.get<by_owner>();
         auto itr = idx.find(owner);
         return (itr == idx.end()) ? 0 : itr->count;
      }

      const token_object* database::find_token(token_id_type id) const {
         const auto& idx = _tokens.get<by_id>();
         auto itr = idx.find(id);
         return (itr == idx.end()) ? nullptr : &*itr;
      }

      const token_object& database::get_token(token_id_type id) const {
         const token_object* token = find_token(id);
         ARTLEDGER_ASSERT(token != nullptr, token_not_found_exception,
                          "Token ${id} has not been minted", ("id", id));
         return *token;
      }

      address database::owner_of(token_id_type id) const {
         return get_token(id).owner;
      }

      address database::get_approved(token_id_type id) const {
         return get_token(id).approved;
      }

      bool database::is_approved_for_all(const address& owner, const address& approved_operator) const {
         const auto& idx = _operator_approvals.get<by_owner_operator>();
         auto itr = idx.find(boost::make_tuple(owner, approved_operator));
         return (itr != idx.end()) && itr->approved;
      }

      uint64_t database::total_supply() const {
         return _next_token_id - ARTLEDGER_FIRST_TOKEN_ID;
      }

      vector<token_id_type> database::tokens_of_owner(const address& owner) const {
         ARTLEDGER_ASSERT(!owner.is_null(), invalid_address_exception,
                          "The tokens of the null address are undefined");
         vector<token_id_type> result;
         const auto& idx = _tokens.get<by_owner>();
         auto range = idx.equal_range(boost::make_tuple(owner));
         for (auto itr = range.first; itr != range.second; ++itr) {
            result.push_back(itr->id);
         }
         return result;
      }

      bool database::supports_interface(uint32_t interface_id) const {
         return interface_id == ARTLEDGER_INTERFACE_ID_INTROSPECTION
                || interface_id == ARTLEDGER_INTERFACE_ID_LEDGER
                || interface_id == ARTLEDGER_INTERFACE_ID_METADATA;
      }

      metadata::artwork_attributes database::get_artwork_attributes(token_id_type id) const {
         const token_object& token = get_token(id);
         const fc::sha256 seed = metadata::derive_seed(_host.current_entropy(), token.id,
                                                       _props.ledger_address);
         return metadata::select_attributes(seed);
      }

      string database::token_uri(token_id_type id) const {
         return metadata::build_token_uri(id, get_artwork_attributes(id));
      }

      const token_object& database::create_token(const address& owner) {
         FC_ASSERT(!owner.is_null(), "Tokens may not be created for the null address");
         const token_id_type id = _next_token_id;
         FC_ASSERT(id != std::numeric_limits<token_id_type>::max(), "Token identifiers are exhausted");

         token_object obj;
         obj.id = id;
         obj.owner = owner;
         obj.minted = _host.current_entropy().timestamp;

         auto result = _tokens.insert(obj);
         FC_ASSERT(result.second, "Token ${id} already exists", ("id", id));
         ++_next_token_id;

         record_undo([this, id]() {
            _tokens.get<by_id>().erase(id);
            _next_token_id = id;
         });
         return *result.first;
      }

      void database::adjust_balance(const address& owner, int64_t delta) {
         auto& idx = _balances.get<by_owner>();
         auto itr = idx.find(owner);

         if (itr == idx.end()) {
            FC_ASSERT(delta >= 0, "Balance of ${owner} would become negative", ("owner", owner));
            balance_object obj;
            obj.owner = owner;
            obj.count = static_cast<uint64_t>(delta);
            idx.insert(obj);
            record_undo([this, owner]() {
               _balances.get<by_owner>().erase(owner);
            });
            return;
         }

         const balance_object previous = *itr;
         FC_ASSERT(delta >= 0 || previous.count >= static_cast<uint64_t>(-delta),
                   "Balance of ${owner} would become negative", ("owner", owner));
         idx.modify(itr, [delta](balance_object& b) {
            b.count = static_cast<uint64_t>(static_cast<int64_t>(b.count) + delta);
         });
         record_undo([this, previous]() {
            auto& i = _balances.get<by_owner>();
            i.replace(i.find(previous.owner), previous);
         });
      }

      void database::set_operator_approval(const address& owner, const address& approved_operator,
                                           bool approved) {
         auto& idx = _operator_approvals.get<by_owner_operator>();
         auto itr = idx.find(boost::make_tuple(owner, approved_operator));

         if (itr == idx.end()) {
            operator_approval_object obj;
            obj.owner = owner;
            obj.approved_operator = approved_operator;
            obj.approved = approved;
            idx.insert(obj);
            record_undo([this, owner, approved_operator]() {
               auto& i = _operator_approvals.get<by_owner_operator>();
               i.erase(i.find(boost::make_tuple(owner, approved_operator)));
            });
            return;
         }

         const operator_approval_object previous = *itr;
         idx.modify(itr, [approved](operator_approval_object& o) {
            o.approved = approved;
         });
         record_undo([this, previous]() {
            auto& i = _operator_approvals.get<by_owner_operator>();
            i.replace(i.find(boost::make_tuple(previous.owner, previous.approved_operator)), previous);
         });
      }

      void database::push_applied_event(const ledger_event& e) {
         _pending_events.push_back(e);
      }

      void database::record_undo(std::function<void()> reverter) {
         if (_undo_enabled) {
            _undo_stack.push_back(std::move(reverter));
         }
      }

      database::undo_session::undo_session(database& db)
         : _db(db), _undo_mark(db._undo_stack.size()), _event_mark(db._pending_events.size()) {
         _db._undo_enabled = true;
      }

      database::undo_session::~undo_session() {
         if (_active) {
            undo();
         }
      }

      void database::undo_session::commit() {
         _db._undo_stack.resize(_undo_mark);
         _db._undo_enabled = false;
         _active = false;
      }

      void database::undo_session::undo() {
         // Revert in the reverse order of application
         while (_db._undo_stack.size() > _undo_mark) {
            std::function<void()> reverter = std::move(_db._undo_stack.back());
            _db._undo_stack.pop_back();
            reverter();
         }
         _db._pending_events.resize(_event_mark);
         _db._undo_enabled = false;
         _active = false;
      }
   }
}
