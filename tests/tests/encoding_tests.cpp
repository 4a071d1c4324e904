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
#include <boost/test/unit_test.hpp>

#include <artledger/metadata/encoding.hpp>

#include <fc/exception/exception.hpp>

#include <limits>

using namespace artledger::metadata;

BOOST_AUTO_TEST_SUITE( encoding_tests )

BOOST_AUTO_TEST_CASE( decimal_string ) {
   try {
      BOOST_CHECK_EQUAL(to_decimal_string(0), "0");
      BOOST_CHECK_EQUAL(to_decimal_string(7), "7");
      BOOST_CHECK_EQUAL(to_decimal_string(10), "10");
      BOOST_CHECK_EQUAL(to_decimal_string(123), "123");
      BOOST_CHECK_EQUAL(to_decimal_string(std::numeric_limits<uint64_t>::max()), "18446744073709551615");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( hex_rgb ) {
   try {
      BOOST_CHECK_EQUAL(to_hex_rgb(0), "000000");
      BOOST_CHECK_EQUAL(to_hex_rgb(0xffffff), "ffffff");
      BOOST_CHECK_EQUAL(to_hex_rgb(0x123456), "123456");
      BOOST_CHECK_EQUAL(to_hex_rgb(0x0a0b0c), "0a0b0c");

      // Only the low 24 bits are rendered
      BOOST_CHECK_EQUAL(to_hex_rgb(0xff00ff00), "00ff00");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( json_escaping ) {
   try {
      BOOST_CHECK_EQUAL(escape_json("a\"b\\c"), "a\\\"b\\\\c");
      BOOST_CHECK_EQUAL(escape_json(""), "");
      BOOST_CHECK_EQUAL(escape_json("plain text"), "plain text");

      // Control characters pass through unchanged
      BOOST_CHECK_EQUAL(escape_json("line\nbreak"), "line\nbreak");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
