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
#include <artledger/app/application.hpp>
#include <artledger/app/cli_arguments.hpp>
#include <artledger/artwork_history/artwork_history.hpp>

#include <artledger/metadata/attributes.hpp>
#include <artledger/metadata/encoding.hpp>
#include <artledger/metadata/token_metadata.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <boost/program_options.hpp>

#include <iostream>

using namespace artledger;
namespace bpo = boost::program_options;

namespace {
   void print(const fc::mutable_variant_object& obj) {
      std::cout << fc::json::to_pretty_string(fc::variant(obj)) << "\n";
   }

   fc::mutable_variant_object describe_token(app::application& node, protocol::token_id_type id) {
      app::ledger_api& api = node.api();
      const metadata::artwork_attributes attrs = node.chain_database().get_artwork_attributes(id);

      fc::mutable_variant_object result;
      result("id", id)
            ("name", metadata::artwork_name(id))
            ("owner", fc::variant(api.owner_of(id), ARTLEDGER_MAX_VARIANT_DEPTH))
            ("approved", fc::variant(api.get_approved(id), ARTLEDGER_MAX_VARIANT_DEPTH))
            ("minted", fc::variant(node.chain_database().get_token(id).minted, ARTLEDGER_MAX_VARIANT_DEPTH))
            ("color_a", "#" + metadata::to_hex_rgb(attrs.color_a))
            ("color_b", "#" + metadata::to_hex_rgb(attrs.color_b))
            ("shape", metadata::shape_display_name(attrs.shape))
            ("block", node.host().head_block_num())
            ("token_uri", api.token_uri(id));
      return result;
   }
}

int main(int argc, char** argv) {
   app::application node;

   try {
      node.register_plugin<artwork_history::artwork_history>(true);

      bpo::options_description app_options("Artledger command line options");
      bpo::options_description cfg_options("Artledger configuration options");
      app_options.add_options()
         ("help,h", "Print this help message and exit")
         ("config-file,c", bpo::value<std::string>(), "Read options from an INI-style file")
         ("mint", bpo::value<std::vector<std::string>>()->composing(),
          "Mint a token to ACCOUNT (a name or 0x followed by 40 hex digits); repeatable")
         ("approve", bpo::value<std::vector<std::string>>()->composing(),
          "OWNER:DELEGATE:ID designates a delegate for a token; repeatable")
         ("transfer", bpo::value<std::vector<std::string>>()->composing(),
          "FROM:TO:ID transfers a token as its owner; repeatable")
         ("blocks", bpo::value<uint32_t>()->default_value(0),
          "Number of blocks to produce before showing tokens")
         ("show-token", bpo::value<std::vector<protocol::token_id_type>>()->composing(),
          "Print the owner, attributes and metadata of a token; repeatable")
         ("show-history", bpo::value<std::vector<protocol::token_id_type>>()->composing(),
          "Print the ownership history of a token; repeatable")
         ("show-account", bpo::value<std::vector<std::string>>()->composing(),
          "Print the balance, tokens and recent history of an account; repeatable")
         ;
      node.set_program_options(app_options, cfg_options);

      bpo::options_description all_options;
      all_options.add(app_options).add(cfg_options);

      bpo::variables_map options;
      bpo::store(bpo::parse_command_line(argc, argv, all_options), options);

      if (options.count("help") > 0) {
         std::cout << all_options << "\n";
         return 0;
      }

      if (options.count("config-file") > 0) {
         app::load_config_file(options["config-file"].as<std::string>(), cfg_options, options);
      }
      bpo::notify(options);

      node.initialize(options);
      node.startup();

      app::ledger_api& api = node.api();

      if (options.count("mint") > 0) {
         for (const std::string& account : options["mint"].as<std::vector<std::string>>()) {
            const protocol::token_id_type id = api.mint(app::parse_account(account));
            ilog("Minted token ${id} to ${account}", ("id", id)("account", account));
         }
      }

      if (options.count("approve") > 0) {
         for (const std::string& arg : options["approve"].as<std::vector<std::string>>()) {
            const app::token_move_argument approval = app::parse_token_move(arg);
            api.approve(approval.first, approval.second, approval.token_id);
         }
      }

      if (options.count("transfer") > 0) {
         for (const std::string& arg : options["transfer"].as<std::vector<std::string>>()) {
            const app::token_move_argument transfer = app::parse_token_move(arg);
            api.transfer_from(transfer.first, transfer.first, transfer.second, transfer.token_id);
         }
      }

      node.host().generate_blocks(options["blocks"].as<uint32_t>());

      if (options.count("show-token") > 0) {
         for (const protocol::token_id_type id : options["show-token"].as<std::vector<protocol::token_id_type>>()) {
            print(describe_token(node, id));
         }
      }

      if (options.count("show-history") > 0) {
         auto history = node.get_plugin<artwork_history::artwork_history>("artwork_history");
         for (const protocol::token_id_type id : options["show-history"].as<std::vector<protocol::token_id_type>>()) {
            fc::mutable_variant_object result;
            result("id", id)
                  ("ownership", fc::variant(history->get_token_history(id), ARTLEDGER_MAX_VARIANT_DEPTH))
                  ("approvals", fc::variant(history->get_approval_history(id), ARTLEDGER_MAX_VARIANT_DEPTH));
            print(result);
         }
      }

      if (options.count("show-account") > 0) {
         auto history = node.get_plugin<artwork_history::artwork_history>("artwork_history");
         const uint32_t limit = options["artwork-history-max-per-account"].as<uint32_t>();
         for (const std::string& account : options["show-account"].as<std::vector<std::string>>()) {
            const protocol::address who = app::parse_account(account);
            fc::mutable_variant_object result;
            result("account", fc::variant(who, ARTLEDGER_MAX_VARIANT_DEPTH))
                  ("balance", api.balance_of(who))
                  ("tokens", fc::variant(api.tokens_of_owner(who), ARTLEDGER_MAX_VARIANT_DEPTH))
                  ("history", fc::variant(history->get_account_history(who, limit), ARTLEDGER_MAX_VARIANT_DEPTH));
            print(result);
         }
      }

      node.shutdown();
   } catch (const fc::exception& e) {
      elog("Exiting with error:\n${e}", ("e", e.to_detail_string()));
      node.shutdown();
      return 1;
   } catch (const boost::program_options::error& e) {
      std::cerr << "Invalid options: " << e.what() << "\n";
      return 1;
   }

   return 0;
}
