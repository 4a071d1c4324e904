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
#include "ledger_fixture.hpp"

#include <fc/exception/exception.hpp>

namespace artledger { namespace chain { namespace test {

test_host::test_host() {
   entropy.block_id = fc::sha256::hash(std::string("test block"));
   entropy.timestamp = fc::time_point_sec(ARTLEDGER_DEFAULT_GENESIS_TIMESTAMP);
}

bool test_host::is_code_bearing(const address& who) const {
   return _receivers.find(who) != _receivers.end();
}

receiver_ack test_host::on_token_received(const address& recipient, const address& op_account,
                                          token_id_type token_id, const std::vector<char>& data) {
   receipt r;
   r.recipient = recipient;
   r.op_account = op_account;
   r.token_id = token_id;
   r.data = data;
   receipts.push_back(r);

   auto itr = _receivers.find(recipient);
   FC_ASSERT(itr != _receivers.end(), "${r} carries no code", ("r", recipient));
   const receiver_callback callback = itr->second;
   return callback(op_account, token_id, data);
}

void test_host::advance(uint32_t seconds) {
   entropy.block_id = fc::sha256::hash(entropy.block_id);
   entropy.timestamp += seconds;
}

void test_host::set_receiver(const address& who, uint32_t value) {
   set_receiver(who, [value](const address&, token_id_type, const std::vector<char>&) {
      receiver_ack ack;
      ack.call_succeeded = true;
      ack.value = value;
      return ack;
   });
}

void test_host::set_failing_receiver(const address& who) {
   set_receiver(who, [](const address&, token_id_type, const std::vector<char>&) {
      return receiver_ack();
   });
}

void test_host::set_receiver(const address& who, receiver_callback callback) {
   _receivers[who] = std::move(callback);
}

ledger_fixture::ledger_fixture()
   : ledger_address(address::from_name("ledger")),
     db(ledger_properties{ledger_address, ARTLEDGER_DEFAULT_COLLECTION_NAME, ARTLEDGER_DEFAULT_COLLECTION_SYMBOL}, host),
     api(db) {
   _events_connection = db.applied_event.connect([this](const ledger_event& e) {
      events.push_back(e);
   });
}

ledger_fixture::~ledger_fixture() {
}

uint64_t ledger_fixture::sum_of_balances() const {
   uint64_t sum = 0;
   for (const balance_object& b : db.get_balance_index()) {
      sum += b.count;
   }
   return sum;
}

token_id_type ledger_fixture::mint_tokens(const address& owner, uint32_t count) {
   token_id_type last = 0;
   for (uint32_t i = 0; i < count; ++i) {
      last = api.mint(owner);
   }
   return last;
}

} } } // artledger::chain::test
