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
#include <artledger/protocol/types.hpp>
#include <artledger/protocol/exceptions.hpp>

#include <fc/exception/exception.hpp>

namespace artledger {
   namespace protocol {
      address::address(const string& hex_str) {
         string digits = hex_str;
         if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            digits = digits.substr(2);
         }
         ARTLEDGER_ASSERT(digits.size() == 2 * addr.data_size(), invalid_address_exception,
                          "An address should contain ${expected} hex digits (${actual} given)",
                          ("expected", 2 * addr.data_size())
                          ("actual", digits.size()));
         addr = fc::ripemd160(digits);
      }

      address address::from_name(const string& name) {
         return address(fc::ripemd160::hash(name));
      }

      bool address::is_null() const {
         return addr == fc::ripemd160();
      }

      string address::to_string() const {
         return "0x" + addr.str();
      }
   }
} // artledger::protocol

namespace fc {
   void to_variant(const artledger::protocol::address& var, fc::variant& vo, uint32_t max_depth) {
      vo = var.to_string();
   }

   void from_variant(const fc::variant& var, artledger::protocol::address& vo, uint32_t max_depth) {
      vo = artledger::protocol::address(var.as_string());
   }
}
