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

#include <artledger/protocol/types.hpp>

#include <boost/program_options.hpp>

#include <string>

namespace artledger {
   namespace app {
      /// Two accounts and a token, written "ACCOUNT:ACCOUNT:ID" on the command line
      struct token_move_argument {
         protocol::address first;
         protocol::address second;
         protocol::token_id_type token_id = 0;
      };

      /**
       * @brief Read an account given either as "0x" and 40 hex digits or as a name
       *
       * Names are hashed into an address with address::from_name().
       * @throws invalid_address_exception for malformed hex
       */
      protocol::address parse_account(const std::string& arg);

      /**
       * @brief Split "ACCOUNT:ACCOUNT:ID"
       * @throws fc::assert_exception unless there are three fields and the ID is a decimal number
       */
      token_move_argument parse_token_move(const std::string& arg);

      /**
       * @brief Merge the options of an INI-style file into @p options
       *
       * Values already present in @p options take precedence; unknown keys are ignored.
       */
      void load_config_file(const std::string& path,
                            const boost::program_options::options_description& cfg,
                            boost::program_options::variables_map& options);
   }
}
