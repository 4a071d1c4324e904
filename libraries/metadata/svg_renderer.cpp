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
#include <artledger/metadata/svg_renderer.hpp>
#include <artledger/metadata/encoding.hpp>

#include <artledger/protocol/config.hpp>

#include <fc/exception/exception.hpp>

namespace artledger {
   namespace metadata {
      namespace {
         // Outer radius 130 and inner radius 55 around the canvas center, first point upwards
         const char* const star_points =
            "200,70 232,156 324,160 252,217 276,305 200,255 124,305 148,217 76,160 168,156";

         std::string fill_of(uint32_t rgb) {
            return "#" + to_hex_rgb(rgb);
         }

         std::string render_background(const std::string& fill_a, const std::string& fill_b) {
            std::string out;
            out += "<defs><linearGradient id=\"bg\" x1=\"0\" y1=\"0\" x2=\"1\" y2=\"1\">";
            out += "<stop offset=\"0\" stop-color=\"" + fill_a + "\"/>";
            out += "<stop offset=\"1\" stop-color=\"" + fill_b + "\"/>";
            out += "</linearGradient></defs>";
            out += "<rect width=\"100%\" height=\"100%\" fill=\"url(#bg)\"/>";
            return out;
         }

         std::string render_circles(const std::string& fill_a, const std::string& fill_b) {
            std::string out;
            out += "<circle cx=\"200\" cy=\"200\" r=\"120\" fill=\"" + fill_a + "\" opacity=\"0.95\"/>";
            out += "<circle cx=\"200\" cy=\"200\" r=\"70\" fill=\"" + fill_b + "\" opacity=\"0.85\"/>";
            return out;
         }

         std::string render_rectangles(const std::string& fill_a, const std::string& fill_b) {
            std::string out;
            out += "<g transform=\"rotate(25 200 200)\">";
            out += "<rect x=\"80\" y=\"80\" width=\"240\" height=\"240\" rx=\"30\" fill=\"" + fill_a + "\"/>";
            out += "<rect x=\"110\" y=\"110\" width=\"180\" height=\"180\" rx=\"25\" fill=\"" + fill_b
                   + "\" opacity=\"0.9\"/>";
            out += "</g>";
            return out;
         }

         std::string render_star(const std::string& fill_a, const std::string& fill_b) {
            std::string out;
            out += "<polygon points=\"";
            out += star_points;
            out += "\" fill=\"" + fill_a + "\"/>";
            out += "<circle cx=\"200\" cy=\"200\" r=\"45\" fill=\"" + fill_b + "\"/>";
            return out;
         }

         std::string render_shape(shape_kind shape, const std::string& fill_a, const std::string& fill_b) {
            switch (shape) {
               case shape_kind::concentric_circles:
                  return render_circles(fill_a, fill_b);
               case shape_kind::rounded_rectangles:
                  return render_rectangles(fill_a, fill_b);
               case shape_kind::star_polygon:
                  return render_star(fill_a, fill_b);
            }
            FC_THROW("Unknown shape kind ${k}", ("k", static_cast<uint32_t>(shape)));
         }

         std::string render_label(token_id_type token_id) {
            std::string out;
            out += "<text x=\"200\" y=\"380\" text-anchor=\"middle\" font-family=\"monospace\" "
                   "font-size=\"20\" fill=\"#ffffff\">";
            out += ARTLEDGER_ARTWORK_NAME_PREFIX + to_decimal_string(token_id);
            out += "</text>";
            return out;
         }
      }

      std::string render_svg(token_id_type token_id, const artwork_attributes& attrs) {
         const std::string fill_a = fill_of(attrs.color_a);
         const std::string fill_b = fill_of(attrs.color_b);
         const std::string size = to_decimal_string(ARTLEDGER_CANVAS_SIZE);

         std::string svg;
         svg += "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" + size + "\" height=\"" + size
                + "\" viewBox=\"0 0 " + size + " " + size + "\">";
         svg += render_background(fill_a, fill_b);
         svg += render_shape(attrs.shape, fill_a, fill_b);
         svg += render_label(token_id);
         svg += "</svg>";
         return svg;
      }
   }
}
