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
#include <artledger/app/simulated_host.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/raw.hpp>

namespace artledger {
   namespace app {
      simulated_host::simulated_host(fc::time_point_sec genesis_time, uint32_t block_interval)
         : _block_interval(block_interval) {
         FC_ASSERT(block_interval > 0, "The block interval should be positive");
         _head.block_id = fc::sha256::hash(std::string("artledger genesis"));
         _head.timestamp = genesis_time;
      }

      block_entropy simulated_host::current_entropy() const {
         return _head;
      }

      bool simulated_host::is_code_bearing(const address& who) const {
         return _receivers.find(who) != _receivers.end();
      }

      receiver_ack simulated_host::on_token_received(const address& recipient, const address& op_account,
                                                     token_id_type token_id, const vector<char>& data) {
         auto itr = _receivers.find(recipient);
         FC_ASSERT(itr != _receivers.end(), "${r} is not a code-bearing recipient", ("r", recipient));
         // The callback may replace or remove its own registration
         const receiver_callback callback = itr->second;
         return callback(op_account, token_id, data);
      }

      void simulated_host::generate_block() {
         ++_head_block_num;

         fc::sha256::encoder enc;
         fc::raw::pack(enc, _head.block_id);
         fc::raw::pack(enc, _head_block_num);
         _head.block_id = enc.result();
         _head.timestamp += _block_interval;
      }

      void simulated_host::generate_blocks(uint32_t count) {
         for (uint32_t i = 0; i < count; ++i) {
            generate_block();
         }
      }

      void simulated_host::register_receiver(const address& who, receiver_callback callback) {
         FC_ASSERT(!who.is_null(), "The null address cannot carry code");
         FC_ASSERT(callback, "A receiver callback is required");
         _receivers[who] = std::move(callback);
      }

      void simulated_host::remove_receiver(const address& who) {
         _receivers.erase(who);
      }
   }
}
