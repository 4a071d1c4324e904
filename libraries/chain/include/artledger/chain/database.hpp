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

#include <artledger/metadata/attributes.hpp>

#include <artledger/protocol/events.hpp>
#include <artledger/protocol/execution_host.hpp>
#include <artledger/protocol/ledger_ops.hpp>

#include <fc/exception/exception.hpp>

#include <boost/signals2/signal.hpp>

#include <functional>
#include <limits>
#include <memory>

namespace artledger {
   namespace chain {
      using protocol::ledger_event;
      using std::string;
      using std::vector;

      /**
       * @brief Identity of a ledger instance
       */
      struct ledger_properties {
         /// Address of the ledger itself; part of every artwork seed
         address ledger_address;

         string name = ARTLEDGER_DEFAULT_COLLECTION_NAME;
         string symbol = ARTLEDGER_DEFAULT_COLLECTION_SYMBOL;
      };

      /**
       *  @class database
       *  @brief Tracks token ownership, balances and approvals
       *
       *  Every mutation goes through push_operation(), which applies the operation inside an undo
       *  session: either all of its effects are kept or none are.  Events are published through
       *  @ref applied_event only after the operation commits.
       */
      class database {
      public:
         database(const ledger_properties& props, protocol::execution_host& host);
         ~database();

         /**
          * Validate, evaluate and apply an operation atomically
          * @param op Operation
          * @return The new token ID for a mint, otherwise void_result
          */
         operation_result push_operation(const operation& op);

         /**
          * @brief Number of tokens held by an owner
          * @throws invalid_address_exception for the null address
          */
         uint64_t balance_of(const address& owner) const;

         /// @throws token_not_found_exception when the token has not been minted
         const token_object& get_token(token_id_type id) const;

         /// @return nullptr when the token has not been minted
         const token_object* find_token(token_id_type id) const;

         address owner_of(token_id_type id) const;

         /// @return The delegate of the token; the null address when none is designated
         address get_approved(token_id_type id) const;

         bool is_approved_for_all(const address& owner, const address& approved_operator) const;

         /// Equals the sum of every balance
         uint64_t total_supply() const;

         token_id_type next_token_id() const { return _next_token_id; }

         /// Tokens held by an owner in ascending order of ID
         vector<token_id_type> tokens_of_owner(const address& owner) const;

         bool supports_interface(uint32_t interface_id) const;

         const ledger_properties& get_properties() const { return _props; }

         /**
          * @brief Attributes of a token under the current entropy snapshot
          *
          * Recomputed on every call and never stored.
          */
         metadata::artwork_attributes get_artwork_attributes(token_id_type id) const;

         /// "data:application/json;utf8,..." metadata of a minted token
         string token_uri(token_id_type id) const;

         const balance_index& get_balance_index() const { return _balances; }

         protocol::execution_host& host() const { return _host; }

         /// Events of the most recently committed operation
         const vector<ledger_event>& get_applied_events() const { return _applied_events; }

         /**
          * Emitted once per event after the operation producing it commits.  A throwing subscriber
          * is logged and skipped; pushing an operation from a subscriber is rejected.
          */
         boost::signals2::signal<void(const ledger_event&)> applied_event;

         //////////////////// Mutation primitives used by evaluators ////////////////////

         /// Create the next token owned by @p owner and advance the next token ID
         const token_object& create_token(const address& owner);

         template<typename Lambda>
         void modify(const token_object& obj, const Lambda& m) {
            auto& idx = _tokens.get<by_id>();
            auto itr = idx.find(obj.id);
            FC_ASSERT(itr != idx.end(), "Token ${id} is not tracked by this database", ("id", obj.id));
            const token_object previous = *itr;
            idx.modify(itr, m);
            record_undo([this, previous]() {
               auto& i = _tokens.get<by_id>();
               i.replace(i.find(previous.id), previous);
            });
         }

         void adjust_balance(const address& owner, int64_t delta);

         void set_operator_approval(const address& owner, const address& approved_operator, bool approved);

         void push_applied_event(const ledger_event& e);

         /**
          * @brief Reverts every mutation made during its lifetime unless committed
          */
         class undo_session {
         public:
            explicit undo_session(database& db);
            ~undo_session();

            undo_session(const undo_session&) = delete;
            undo_session& operator=(const undo_session&) = delete;

            void commit();
            void undo();

         private:
            database& _db;
            size_t _undo_mark;
            size_t _event_mark;
            bool _active = true;
         };

      private:
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator();

         operation_result apply_operation(const operation& op);

         void record_undo(std::function<void()> reverter);

         void publish_applied_events();

         ledger_properties _props;
         protocol::execution_host& _host;

         token_index _tokens;
         balance_index _balances;
         operator_approval_index _operator_approvals;
         token_id_type _next_token_id = ARTLEDGER_FIRST_TOKEN_ID;

         vector<std::function<void()>> _undo_stack;
         bool _undo_enabled = false;
         bool _applying_operation = false;

         vector<ledger_event> _pending_events;
         vector<ledger_event> _applied_events;

         vector<std::unique_ptr<op_evaluator>> _operation_evaluators;
      };
   }
}

FC_REFLECT( artledger::chain::ledger_properties, (ledger_address)(name)(symbol) )
