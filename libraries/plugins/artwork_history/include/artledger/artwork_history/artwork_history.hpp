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

#include <artledger/app/plugin.hpp>
#include <artledger/chain/database.hpp>

#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

namespace artledger { namespace artwork_history {
using protocol::address;
using protocol::token_id_type;
using std::string;
using std::vector;

/// A change of ownership; minting is recorded with a null sender
struct ownership_record
{
   uint64_t sequence = 0;
   fc::time_point_sec timestamp;
   token_id_type token_id = 0;
   address from;
   address to;
};

/// A delegate designation, or an operator grant or revocation when for_all is set
struct approval_record
{
   uint64_t sequence = 0;
   fc::time_point_sec timestamp;
   address owner;
   address grantee;
   token_id_type token_id = 0;
   bool for_all = false;
   bool granted = false;
};

struct by_sequence;
struct by_token_sequence;
struct by_from_sequence;
struct by_to_sequence;
struct by_owner_sequence;

using namespace boost::multi_index;

typedef multi_index_container <
   ownership_record,
   indexed_by<
      ordered_unique< tag<by_sequence>, member<ownership_record, uint64_t, &ownership_record::sequence> >,
      ordered_unique< tag<by_token_sequence>,
         composite_key< ownership_record,
            member<ownership_record, token_id_type, &ownership_record::token_id>,
            member<ownership_record, uint64_t, &ownership_record::sequence>
         >
      >,
      ordered_unique< tag<by_from_sequence>,
         composite_key< ownership_record,
            member<ownership_record, address, &ownership_record::from>,
            member<ownership_record, uint64_t, &ownership_record::sequence>
         >
      >,
      ordered_unique< tag<by_to_sequence>,
         composite_key< ownership_record,
            member<ownership_record, address, &ownership_record::to>,
            member<ownership_record, uint64_t, &ownership_record::sequence>
         >
      >
   >
> ownership_record_index;

typedef multi_index_container <
   approval_record,
   indexed_by<
      ordered_unique< tag<by_sequence>, member<approval_record, uint64_t, &approval_record::sequence> >,
      ordered_unique< tag<by_token_sequence>,
         composite_key< approval_record,
            member<approval_record, token_id_type, &approval_record::token_id>,
            member<approval_record, uint64_t, &approval_record::sequence>
         >
      >,
      ordered_unique< tag<by_owner_sequence>,
         composite_key< approval_record,
            member<approval_record, address, &approval_record::owner>,
            member<approval_record, uint64_t, &approval_record::sequence>
         >
      >
   >
> approval_record_index;

namespace detail
{
    class artwork_history_impl;
}

/**
 * @brief Records the ownership and approval events published by the ledger
 *
 * Only committed operations are observed, so rejected operations leave no trace.
 */
class artwork_history : public artledger::app::plugin
{
   public:
      explicit artwork_history(artledger::app::application& app);
      ~artwork_history() override;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) override;
      void plugin_initialize(const boost::program_options::variables_map& options) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      /**
       * @brief Get the ownership changes of a token, oldest first
       * @param token_id Token ID
       * @return Ownership records, starting with the mint
       */
      vector<ownership_record> get_token_history(token_id_type token_id) const;

      /**
       * @brief Get the ownership changes involving an account, newest first
       * @param account Sender or recipient
       * @param limit Maximum number of records; capped by --artwork-history-max-per-account
       * @return Ownership records
       */
      vector<ownership_record> get_account_history(const address& account, uint32_t limit) const;

      /**
       * @brief Get the delegate designations of a token, oldest first
       * @param token_id Token ID
       */
      vector<approval_record> get_approval_history(token_id_type token_id) const;

      /**
       * @brief Get every approval granted or revoked by an owner, oldest first
       * @param owner Token owner
       */
      vector<approval_record> get_approvals_by_owner(const address& owner) const;

      const ownership_record_index& get_ownership_records() const;

   private:
      void cleanup();
      std::unique_ptr<detail::artwork_history_impl> my;
};

} } // artledger::artwork_history

FC_REFLECT( artledger::artwork_history::ownership_record, (sequence)(timestamp)(token_id)(from)(to) )
FC_REFLECT( artledger::artwork_history::approval_record,
            (sequence)(timestamp)(owner)(grantee)(token_id)(for_all)(granted) )
