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
#include <artledger/protocol/ledger_ops.hpp>
#include <artledger/protocol/exceptions.hpp>

namespace artledger {
   namespace protocol {
      // Only the caller is checked here.  Every other check depends on ledger state and must
      // run in the order fixed by the evaluators.
      static void validate_caller(const address& caller) {
         ARTLEDGER_ASSERT(!caller.is_null(), invalid_address_exception,
                          "The caller should not be the null address");
      }

      void mint_operation::validate() const {
         validate_caller(caller);
      }

      void approve_operation::validate() const {
         validate_caller(caller);
      }

      void set_approval_for_all_operation::validate() const {
         validate_caller(caller);
         ARTLEDGER_ASSERT(approved_operator != caller, invalid_approval_exception,
                          "An owner may not approve itself as an operator (${caller})",
                          ("caller", caller));
      }

      void transfer_operation::validate() const {
         validate_caller(caller);
      }

      void safe_transfer_operation::validate() const {
         validate_caller(caller);
      }

      transfer_operation safe_transfer_operation::as_transfer() const {
         transfer_operation t;
         t.caller = caller;
         t.from = from;
         t.to = to;
         t.token_id = token_id;
         return t;
      }

      void validate_operation(const operation& op) {
         op.visit(operation_validator());
      }
   }
}
