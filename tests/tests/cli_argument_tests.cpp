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

#include <artledger/app/application.hpp>
#include <artledger/app/cli_arguments.hpp>

#include <fc/filesystem.hpp>

#include <fstream>

#include "../common/ledger_fixture.hpp"

using namespace artledger;
namespace bpo = boost::program_options;

BOOST_AUTO_TEST_SUITE( cli_argument_tests )

BOOST_AUTO_TEST_CASE( account_arguments ) {
   try {
      BOOST_CHECK(app::parse_account("alice") == address::from_name("alice"));
      BOOST_CHECK_EQUAL(app::parse_account("0x00112233445566778899aabbccddeeff00112233").to_string(),
                        "0x00112233445566778899aabbccddeeff00112233");

      ARTLEDGER_REQUIRE_THROW(app::parse_account("0x1234"), invalid_address_exception);
      ARTLEDGER_REQUIRE_THROW(app::parse_account(""), fc::exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( token_move_arguments ) {
   try {
      const app::token_move_argument move = app::parse_token_move("alice:bob:12");
      BOOST_CHECK(move.first == address::from_name("alice"));
      BOOST_CHECK(move.second == address::from_name("bob"));
      BOOST_CHECK_EQUAL(move.token_id, 12u);

      const app::token_move_argument hex = app::parse_token_move("0x00112233445566778899aabbccddeeff00112233:bob:1");
      BOOST_CHECK_EQUAL(hex.first.to_string(), "0x00112233445566778899aabbccddeeff00112233");
      BOOST_CHECK_EQUAL(hex.token_id, 1u);

      REQUIRE_EXCEPTION_WITH_TEXT(app::parse_token_move("alice:bob:abc"), "Invalid token ID");
      REQUIRE_EXCEPTION_WITH_TEXT(app::parse_token_move("alice:bob:-1"), "Invalid token ID");
      REQUIRE_EXCEPTION_WITH_TEXT(app::parse_token_move("alice:bob:"), "Invalid token ID");
      REQUIRE_EXCEPTION_WITH_TEXT(app::parse_token_move("alice:bob:99999999999999999999999"), "Invalid token ID");
      REQUIRE_EXCEPTION_WITH_TEXT(app::parse_token_move("alice:bob"), "Expected ACCOUNT:ACCOUNT:ID");
      REQUIRE_EXCEPTION_WITH_TEXT(app::parse_token_move("alice:bob:1:2"), "Expected ACCOUNT:ACCOUNT:ID");
      ARTLEDGER_REQUIRE_THROW(app::parse_token_move("0x12:bob:1"), invalid_address_exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( config_file ) {
   try {
      fc::temp_directory dir;
      const std::string path = (dir.path() / "config.ini").string();
      {
         std::ofstream out(path);
         out << "# Collection identity\n";
         out << "collection-name = Config Works\n";
         out << "collection-symbol = CW\n";
         out << "unknown-key = ignored\n";
      }

      app::application node;
      bpo::options_description cli;
      bpo::options_description cfg;
      node.set_program_options(cli, cfg);
      cli.add(cfg);

      // The command line takes precedence over the file
      const char* argv[] = { "artledger_tests", "--collection-symbol=CLI" };
      bpo::variables_map options;
      bpo::store(bpo::parse_command_line(2, argv, cli), options);
      app::load_config_file(path, cfg, options);
      bpo::notify(options);

      node.initialize(options);
      BOOST_CHECK_EQUAL(node.api().name(), "Config Works");
      BOOST_CHECK_EQUAL(node.api().symbol(), "CLI");

      bpo::variables_map missing;
      REQUIRE_EXCEPTION_WITH_TEXT(app::load_config_file((dir.path() / "absent.ini").string(), cfg, missing),
                                  "Unable to read configuration file");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
