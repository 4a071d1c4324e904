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
#include <artledger/artwork_history/artwork_history.hpp>

#include <artledger/app/application.hpp>

#include <boost/signals2/connection.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>
#include <iterator>

namespace artledger {
   namespace artwork_history {

      namespace detail {

         class artwork_history_impl {
         public:
            explicit artwork_history_impl(artwork_history &_plugin);

            virtual ~artwork_history_impl();

            void on_event(const protocol::ledger_event &e);

            artledger::chain::database &database() const {
               return _self.database();
            }

            friend class artledger::artwork_history::artwork_history;

            vector<ownership_record> get_token_history(token_id_type token_id) const;

            vector<ownership_record> get_account_history(const address &account, uint32_t limit) const;

            vector<approval_record> get_approval_history(token_id_type token_id) const;

            vector<approval_record> get_approvals_by_owner(const address &owner) const;

            void record_ownership(token_id_type token_id, const address &from, const address &to);

            void record_approval(const address &owner, const address &grantee, token_id_type token_id,
                                 bool for_all, bool granted);

         private:
            artwork_history &_self;

            uint32_t _max_per_account = ARTLEDGER_DEFAULT_HISTORY_MAX_PER_ACCOUNT;
            uint64_t _next_sequence = 0;

            ownership_record_index _ownership;
            approval_record_index _approvals;

            boost::signals2::scoped_connection _event_connection;
         };

         struct event_recorder {
            artwork_history_impl &_impl;

            explicit event_recorder(artwork_history_impl &impl) : _impl(impl) {
            }

            typedef void result_type;

            void operator()( const protocol::token_transferred_event& e ) const {
               _impl.record_ownership(e.token_id, e.from, e.to);
            }

            void operator()( const protocol::token_approved_event& e ) const {
               // Clearing the delegate is recorded as a revocation
               _impl.record_approval(e.owner, e.approved, e.token_id, false, !e.approved.is_null());
            }

            void operator()( const protocol::approval_for_all_event& e ) const {
               _impl.record_approval(e.owner, e.approved_operator, 0, true, e.approved);
            }
         };

         artwork_history_impl::artwork_history_impl(artwork_history &_plugin) :
            _self(_plugin) {
         }

         artwork_history_impl::~artwork_history_impl() {
         }

         void artwork_history_impl::on_event(const protocol::ledger_event &e) {
            try {
               e.visit( event_recorder(*this) );
            } FC_CAPTURE_AND_LOG( (e) )
         }

         void artwork_history_impl::record_ownership(token_id_type token_id, const address &from,
                                                     const address &to) {
            ownership_record r;
            r.sequence = _next_sequence++;
            r.timestamp = database().host().current_entropy().timestamp;
            r.token_id = token_id;
            r.from = from;
            r.to = to;
            _ownership.insert(r);
         }

         void artwork_history_impl::record_approval(const address &owner, const address &grantee,
                                                    token_id_type token_id, bool for_all, bool granted) {
            approval_record r;
            r.sequence = _next_sequence++;
            r.timestamp = database().host().current_entropy().timestamp;
            r.owner = owner;
            r.grantee = grantee;
            r.token_id = token_id;
            r.for_all = for_all;
            r.granted = granted;
            _approvals.insert(r);
         }

         vector<ownership_record> artwork_history_impl::get_token_history(token_id_type token_id) const {
            vector<ownership_record> result;
            const auto &idx = _ownership.get<by_token_sequence>();
            auto range = idx.equal_range(boost::make_tuple(token_id));
            std::copy(range.first, range.second, std::back_inserter(result));
            return result;
         }

         vector<ownership_record> artwork_history_impl::get_account_history(const address &account,
                                                                            uint32_t limit) const {
            FC_ASSERT(!account.is_null(), "The history of the null address is not tracked");
            limit = std::min(limit, _max_per_account);

            vector<ownership_record> result;
            const auto &from_idx = _ownership.get<by_from_sequence>();
            const auto &to_idx = _ownership.get<by_to_sequence>();
            auto from_range = from_idx.equal_range(boost::make_tuple(account));
            auto to_range = to_idx.equal_range(boost::make_tuple(account));

            // Merge both ranges walking backwards from the newest sequence
            auto from_itr = from_range.second;
            auto to_itr = to_range.second;
            while (result.size() < limit && (from_itr != from_range.first || to_itr != to_range.first)) {
               const ownership_record *from_rec = (from_itr != from_range.first) ? &*std::prev(from_itr) : nullptr;
               const ownership_record *to_rec = (to_itr != to_range.first) ? &*std::prev(to_itr) : nullptr;

               if (from_rec && to_rec && from_rec->sequence == to_rec->sequence) {
                  // Self-transfer appears in both ranges
                  result.push_back(*from_rec);
                  --from_itr;
                  --to_itr;
               } else if (to_rec == nullptr || (from_rec && from_rec->sequence > to_rec->sequence)) {
                  result.push_back(*from_rec);
                  --from_itr;
               } else {
                  result.push_back(*to_rec);
                  --to_itr;
               }
            }
            return result;
         }

         vector<approval_record> artwork_history_impl::get_approval_history(token_id_type token_id) const {
            vector<approval_record> result;
            const auto &idx = _approvals.get<by_token_sequence>();
            auto range = idx.equal_range(boost::make_tuple(token_id));
            for (auto itr = range.first; itr != range.second; ++itr) {
               if (!itr->for_all) {
                  result.push_back(*itr);
               }
            }
            return result;
         }

         vector<approval_record> artwork_history_impl::get_approvals_by_owner(const address &owner) const {
            vector<approval_record> result;
            const auto &idx = _approvals.get<by_owner_sequence>();
            auto range = idx.equal_range(boost::make_tuple(owner));
            std::copy(range.first, range.second, std::back_inserter(result));
            return result;
         }

      } // end namespace detail

      artwork_history::artwork_history(artledger::app::application &app) :
         plugin(app),
         my(std::make_unique<detail::artwork_history_impl>(*this)) {
      }

      artwork_history::~artwork_history() {
         cleanup();
      }

      std::string artwork_history::plugin_name() const {
         return "artwork_history";
      }

      std::string artwork_history::plugin_description() const {
         return "Records the ownership and approval history of every artwork";
      }

      void artwork_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cfg.add_options()
            ("artwork-history-max-per-account",
             boost::program_options::value<uint32_t>()->default_value(ARTLEDGER_DEFAULT_HISTORY_MAX_PER_ACCOUNT),
             "Maximum number of records returned by one account history query");
      }

      void artwork_history::plugin_initialize(const boost::program_options::variables_map &options) {
         if (options.count("artwork-history-max-per-account") > 0) {
            my->_max_per_account = options["artwork-history-max-per-account"].as<uint32_t>();
         }
         FC_ASSERT(my->_max_per_account > 0, "artwork-history-max-per-account should be positive");

         my->_event_connection = database().applied_event.connect([this](const protocol::ledger_event &e) {
            my->on_event(e);
         });
      }

      void artwork_history::plugin_startup() {
         ilog("artwork_history: plugin_startup() begin");
      }

      void artwork_history::plugin_shutdown() {
         ilog("artwork_history: plugin_shutdown() begin");
         cleanup();
      }

      void artwork_history::cleanup() {
         my->_event_connection.disconnect();
      }

      vector<ownership_record> artwork_history::get_token_history(token_id_type token_id) const {
         return my->get_token_history(token_id);
      }

      vector<ownership_record> artwork_history::get_account_history(const address &account, uint32_t limit) const {
         return my->get_account_history(account, limit);
      }

      vector<approval_record> artwork_history::get_approval_history(token_id_type token_id) const {
         return my->get_approval_history(token_id);
      }

      vector<approval_record> artwork_history::get_approvals_by_owner(const address &owner) const {
         return my->get_approvals_by_owner(owner);
      }

      const ownership_record_index &artwork_history::get_ownership_records() const {
         return my->_ownership;
      }

   }
}
