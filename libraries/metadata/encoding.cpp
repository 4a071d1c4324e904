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
#include <artledger/metadata/encoding.hpp>

namespace artledger {
   namespace metadata {
      std::string to_decimal_string(uint64_t value) {
         if (value == 0) {
            return "0";
         }

         // Count the digits first so the buffer is filled from its end
         uint32_t digits = 0;
         for (uint64_t temp = value; temp != 0; temp /= 10) {
            ++digits;
         }

         std::string result(digits, '0');
         while (value != 0) {
            --digits;
            result[digits] = static_cast<char>('0' + (value % 10));
            value /= 10;
         }
         return result;
      }

      std::string to_hex_rgb(uint32_t rgb) {
         static const char alphabet[] = "0123456789abcdef";

         std::string result(6, '0');
         for (uint32_t i = 0; i < 6; ++i) {
            const uint32_t shift = 20 - 4 * i;
            result[i] = alphabet[(rgb >> shift) & 0xf];
         }
         return result;
      }

      std::string escape_json(const std::string& input) {
         std::string result;
         result.reserve(input.size());
         for (const char c : input) {
            if (c == '"') {
               result += "\\\"";
            } else if (c == '\\') {
               result += "\\\\";
            } else {
               result += c;
            }
         }
         return result;
      }
   }
}
