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
#include <artledger/app/cli_arguments.hpp>

#include <fc/exception/exception.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <fstream>

namespace artledger {
   namespace app {
      protocol::address parse_account(const std::string& arg) {
         FC_ASSERT(!arg.empty(), "An account should not be empty");
         if (boost::starts_with(arg, "0x")) {
            return protocol::address(arg);
         }
         return protocol::address::from_name(arg);
      }

      token_move_argument parse_token_move(const std::string& arg) {
         std::vector<std::string> parts;
         boost::split(parts, arg, boost::is_any_of(":"));
         FC_ASSERT(parts.size() == 3, "Expected ACCOUNT:ACCOUNT:ID but got '${arg}'", ("arg", arg));

         // lexical_cast accepts a leading minus for unsigned targets
         const std::string& id = parts[2];
         FC_ASSERT(!id.empty() && boost::all(id, boost::is_digit()), "Invalid token ID '${id}'", ("id", id));

         token_move_argument result;
         result.first = parse_account(parts[0]);
         result.second = parse_account(parts[1]);
         try {
            result.token_id = boost::lexical_cast<protocol::token_id_type>(id);
         } catch (const boost::bad_lexical_cast&) {
            FC_THROW("Invalid token ID '${id}'", ("id", id));
         }
         return result;
      }

      void load_config_file(const std::string& path,
                            const boost::program_options::options_description& cfg,
                            boost::program_options::variables_map& options) {
         std::ifstream config(path);
         FC_ASSERT(config.good(), "Unable to read configuration file ${path}", ("path", path));
         boost::program_options::store(boost::program_options::parse_config_file(config, cfg, true), options);
      }
   }
}
