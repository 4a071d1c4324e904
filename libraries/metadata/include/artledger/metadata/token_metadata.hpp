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

#include <artledger/metadata/attributes.hpp>

#include <string>

namespace artledger {
   namespace metadata {
      /// "AI Artwork #<id>"
      std::string artwork_name(token_id_type token_id);

      /// "#<hexA> / #<hexB>"
      std::string palette_value(const artwork_attributes& attrs);

      /**
       * @brief Assemble the JSON metadata document of a token
       *
       * The name, description and image fields pass through escape_json().  The image is the
       * rendered SVG wrapped as a "data:image/svg+xml;utf8," URI.
       */
      std::string build_token_json(token_id_type token_id, const artwork_attributes& attrs);

      /**
       * @brief Wrap the metadata document of a token as a "data:application/json;utf8," URI
       */
      std::string build_token_uri(token_id_type token_id, const artwork_attributes& attrs);
   }
}
