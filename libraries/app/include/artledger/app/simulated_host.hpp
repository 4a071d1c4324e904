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

#include <artledger/protocol/execution_host.hpp>

#include <functional>
#include <map>

namespace artledger {
   namespace app {
      using protocol::address;
      using protocol::block_entropy;
      using protocol::receiver_ack;
      using protocol::token_id_type;
      using std::vector;

      /**
       * @brief In-process execution host that produces blocks on demand
       *
       * Block IDs are chained hashes and timestamps advance by a fixed interval, so a given block
       * number always yields the same entropy.  Code-bearing recipients are modelled by
       * registered callbacks.
       */
      class simulated_host : public protocol::execution_host {
      public:
         typedef std::function<receiver_ack(const address& op_account, token_id_type token_id,
                                            const vector<char>& data)> receiver_callback;

         explicit simulated_host(fc::time_point_sec genesis_time = fc::time_point_sec(ARTLEDGER_DEFAULT_GENESIS_TIMESTAMP),
                                 uint32_t block_interval = ARTLEDGER_DEFAULT_BLOCK_INTERVAL);

         block_entropy current_entropy() const override;

         bool is_code_bearing(const address& who) const override;

         receiver_ack on_token_received(const address& recipient, const address& op_account,
                                        token_id_type token_id, const vector<char>& data) override;

         /// Advance the head block, changing the entropy of every later metadata query
         void generate_block();

         void generate_blocks(uint32_t count);

         uint32_t head_block_num() const { return _head_block_num; }

         /// Mark @p who as code-bearing, answering receipt calls through @p callback
         void register_receiver(const address& who, receiver_callback callback);

         void remove_receiver(const address& who);

      private:
         uint32_t _block_interval;
         uint32_t _head_block_num = 0;
         block_entropy _head;
         std::map<address, receiver_callback> _receivers;
      };
   }
}
