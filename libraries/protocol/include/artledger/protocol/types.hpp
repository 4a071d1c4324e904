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

#include <fc/crypto/ripemd160.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <artledger/protocol/config.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace artledger {
   namespace protocol {
      using std::string;
      using std::vector;

      typedef uint64_t token_id_type;

      /**
       * @brief A 160-bit identity that may own tokens, hold approvals or call the ledger
       *
       * The default-constructed address is the null identity.  Its textual form is
       * "0x" followed by 40 lowercase hex digits.
       */
      class address {
      public:
         address() {}
         explicit address(const fc::ripemd160& a) : addr(a) {}

         /// Accepts 40 hex digits with or without a leading "0x"
         explicit address(const string& hex_str);

         /// Deterministically derive an identity from a human-readable name
         static address from_name(const string& name);

         bool is_null() const;
         string to_string() const;

         fc::ripemd160 addr;

         friend bool operator==(const address& a, const address& b) { return a.addr == b.addr; }
         friend bool operator!=(const address& a, const address& b) { return a.addr != b.addr; }
         friend bool operator<(const address& a, const address& b) { return a.addr < b.addr; }
      };

      struct void_result {};
   }
} // artledger::protocol

namespace fc {
   void to_variant(const artledger::protocol::address& var, fc::variant& vo, uint32_t max_depth = 1);
   void from_variant(const fc::variant& var, artledger::protocol::address& vo, uint32_t max_depth = 1);
}

FC_REFLECT_EMPTY( artledger::protocol::void_result )
