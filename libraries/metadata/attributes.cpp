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
#include <artledger/metadata/attributes.hpp>

#include <fc/exception/exception.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace artledger {
   namespace metadata {
      using boost::multiprecision::uint256_t;

      namespace {
         const uint32_t uint256_width = 32;
         const uint32_t color_mask = 0xffffff;

         void write_uint256_be(fc::sha256::encoder& enc, uint64_t value) {
            char buffer[uint256_width] = {0};
            for (uint32_t i = 0; i < sizeof(value); ++i) {
               buffer[uint256_width - 1 - i] = static_cast<char>((value >> (8 * i)) & 0xff);
            }
            enc.write(buffer, uint256_width);
         }
      }

      fc::sha256 derive_seed(const protocol::block_entropy& entropy, token_id_type token_id,
                             const address& ledger) {
         fc::sha256::encoder enc;
         enc.write(entropy.block_id.data(), entropy.block_id.data_size());
         write_uint256_be(enc, entropy.timestamp.sec_since_epoch());
         write_uint256_be(enc, token_id);
         enc.write(ledger.addr.data(), ledger.addr.data_size());
         return enc.result();
      }

      artwork_attributes select_attributes(const fc::sha256& seed) {
         const unsigned char* begin = reinterpret_cast<const unsigned char*>(seed.data());
         const unsigned char* end = begin + seed.data_size();

         uint256_t value;
         import_bits(value, begin, end, 8, true);

         artwork_attributes attrs;
         attrs.color_a = static_cast<uint32_t>((value >> 24) & color_mask);
         attrs.color_b = static_cast<uint32_t>((value >> 48) & color_mask);
         attrs.shape = static_cast<shape_kind>(static_cast<uint32_t>(value % 3));
         return attrs;
      }

      std::string shape_display_name(shape_kind shape) {
         switch (shape) {
            case shape_kind::concentric_circles:
               return "Concentric Circles";
            case shape_kind::rounded_rectangles:
               return "Rounded Rectangles";
            case shape_kind::star_polygon:
               return "Star Polygon";
         }
         FC_THROW("Unknown shape kind ${k}", ("k", static_cast<uint32_t>(shape)));
      }
   }
}
