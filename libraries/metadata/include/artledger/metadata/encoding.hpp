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

#include <cstdint>
#include <string>

namespace artledger {
   namespace metadata {
      /**
       * @brief Base-10 rendering of an unsigned integer
       * @return Digits without leading zeros; "0" for zero
       */
      std::string to_decimal_string(uint64_t value);

      /**
       * @brief Six lowercase hex digits of a 24-bit color, most significant nibble first
       *
       * No leading '#'.  Bits above the low 24 are ignored.
       */
      std::string to_hex_rgb(uint32_t rgb);

      /**
       * @brief Minimal JSON string escaping
       *
       * Only '"' and '\' are escaped.  Control characters are copied unchanged, so the input
       * must not contain any.
       */
      std::string escape_json(const std::string& input);
   }
}
