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
#include <artledger/metadata/token_metadata.hpp>
#include <artledger/metadata/encoding.hpp>
#include <artledger/metadata/svg_renderer.hpp>

#include <artledger/protocol/config.hpp>

namespace artledger {
   namespace metadata {
      namespace {
         std::string trait(const std::string& trait_type, const std::string& value) {
            return "{\"trait_type\":\"" + trait_type + "\",\"value\":\"" + value + "\"}";
         }
      }

      std::string artwork_name(token_id_type token_id) {
         return ARTLEDGER_ARTWORK_NAME_PREFIX + to_decimal_string(token_id);
      }

      std::string palette_value(const artwork_attributes& attrs) {
         return "#" + to_hex_rgb(attrs.color_a) + " / #" + to_hex_rgb(attrs.color_b);
      }

      std::string build_token_json(token_id_type token_id, const artwork_attributes& attrs) {
         const std::string image = ARTLEDGER_SVG_URI_PREFIX + render_svg(token_id, attrs);

         std::string json;
         json += "{\"name\":\"" + escape_json(artwork_name(token_id)) + "\"";
         json += ",\"description\":\"" + escape_json(ARTLEDGER_ARTWORK_DESCRIPTION) + "\"";
         json += ",\"attributes\":[";
         json += trait("palette", palette_value(attrs));
         json += ",";
         json += trait("shape", shape_display_name(attrs.shape));
         json += "]";
         json += ",\"image\":\"" + escape_json(image) + "\"";
         json += "}";
         return json;
      }

      std::string build_token_uri(token_id_type token_id, const artwork_attributes& attrs) {
         return ARTLEDGER_JSON_URI_PREFIX + build_token_json(token_id, attrs);
      }
   }
}
