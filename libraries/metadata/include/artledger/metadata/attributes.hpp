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

#include <fc/crypto/sha256.hpp>

#include <artledger/protocol/execution_host.hpp>
#include <artledger/protocol/types.hpp>

namespace artledger {
   namespace metadata {
      using protocol::address;
      using protocol::token_id_type;

      enum class shape_kind : uint8_t {
         concentric_circles = 0,
         rounded_rectangles = 1,
         star_polygon = 2
      };

      /**
       * @brief Visual attributes selected from a seed
       */
      struct artwork_attributes {
         /// 24-bit RGB
         uint32_t color_a = 0;

         /// 24-bit RGB
         uint32_t color_b = 0;

         shape_kind shape = shape_kind::concentric_circles;
      };

      /**
       * @brief Derive the seed for a token from a block entropy snapshot
       *
       * The preimage is the 32-byte block ID, the timestamp and the token ID each as 32-byte
       * big-endian integers, then the 20-byte ledger address.
       *
       * @param entropy Most recent block hash and timestamp
       * @param token_id Token
       * @param ledger Address of the ledger itself
       * @return SHA-256 digest of the preimage
       */
      fc::sha256 derive_seed(const protocol::block_entropy& entropy, token_id_type token_id,
                             const address& ledger);

      /**
       * @brief Decompose a seed, read as a big-endian 256-bit integer
       *
       * color_a takes bits [24,48), color_b takes bits [48,72) and the shape is the seed modulo 3.
       */
      artwork_attributes select_attributes(const fc::sha256& seed);

      /// "Concentric Circles", "Rounded Rectangles" or "Star Polygon"
      std::string shape_display_name(shape_kind shape);
   }
}
