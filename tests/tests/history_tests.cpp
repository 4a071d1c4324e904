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
#include <artledger/artwork_history/artwork_history.hpp>

#include <fc/exception/exception.hpp>

#include "../common/ledger_fixture.hpp"

using namespace artledger;
using artledger::artwork_history::ownership_record;
using artledger::artwork_history::approval_record;

namespace {
   /// Application with the history plugin enabled, configured from @p args
   struct history_fixture {
      explicit history_fixture(std::vector<std::string> args = std::vector<std::string>()) {
         plugin = node.register_plugin<artwork_history::artwork_history>(true);

         boost::program_options::options_description cli;
         boost::program_options::options_description cfg;
         node.set_program_options(cli, cfg);
         cli.add(cfg);

         args.insert(args.begin(), "artledger_tests");
         std::vector<const char*> argv;
         for (const std::string& a : args) {
            argv.push_back(a.c_str());
         }
         boost::program_options::variables_map options;
         boost::program_options::store(
            boost::program_options::parse_command_line(static_cast<int>(argv.size()), argv.data(), cli), options);
         boost::program_options::notify(options);

         node.initialize(options);
         node.startup();
      }

      ~history_fixture() {
         node.shutdown();
      }

      app::application node;
      std::shared_ptr<artwork_history::artwork_history> plugin;
   };
}

namespace {
   /// Counts how often the application shuts it down
   class counting_plugin : public app::plugin {
   public:
      explicit counting_plugin(app::application& a) : plugin(a) {}

      std::string plugin_name() const override { return "counting"; }

      void plugin_shutdown() override { ++shutdowns; }

      static uint32_t shutdowns;
   };

   uint32_t counting_plugin::shutdowns = 0;
}

BOOST_AUTO_TEST_SUITE( history_tests )

BOOST_AUTO_TEST_CASE( token_history ) {
   try {
      history_fixture f;
      app::ledger_api& api = f.node.api();
      ACTORS((alice)(bob)(carol));

      const token_id_type id = api.mint(alice_id);
      api.mint(bob_id);
      f.node.host().generate_block();
      api.transfer_from(alice_id, alice_id, bob_id, id);
      api.transfer_from(bob_id, bob_id, carol_id, id);

      const std::vector<ownership_record> history = f.plugin->get_token_history(id);
      BOOST_REQUIRE_EQUAL(history.size(), 3u);
      BOOST_CHECK(history[0].from.is_null());
      BOOST_CHECK(history[0].to == alice_id);
      BOOST_CHECK(history[1].from == alice_id);
      BOOST_CHECK(history[1].to == bob_id);
      BOOST_CHECK(history[2].from == bob_id);
      BOOST_CHECK(history[2].to == carol_id);
      BOOST_CHECK(history[0].sequence < history[1].sequence);
      BOOST_CHECK(history[1].sequence < history[2].sequence);

      // Records carry the block time of the operation
      BOOST_CHECK(history[1].timestamp == history[0].timestamp + ARTLEDGER_DEFAULT_BLOCK_INTERVAL);

      BOOST_CHECK(f.plugin->get_token_history(99).empty());
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( rejected_operations_leave_no_history ) {
   try {
      history_fixture f;
      app::ledger_api& api = f.node.api();
      ACTORS((alice)(mallory)(vault));

      const token_id_type id = api.mint(alice_id);
      f.node.host().register_receiver(vault_id, [](const address&, token_id_type, const std::vector<char>&) {
         return receiver_ack();
      });

      ARTLEDGER_REQUIRE_THROW(api.transfer_from(mallory_id, alice_id, mallory_id, id), unauthorized_exception);
      ARTLEDGER_REQUIRE_THROW(api.safe_transfer_from(alice_id, alice_id, vault_id, id), receiver_rejected_exception);

      BOOST_CHECK_EQUAL(f.plugin->get_token_history(id).size(), 1u);
      BOOST_CHECK_EQUAL(f.plugin->get_ownership_records().size(), 1u);

      // Without code the vault accepts unconditionally
      f.node.host().remove_receiver(vault_id);
      api.safe_transfer_from(alice_id, alice_id, vault_id, id);
      BOOST_CHECK_EQUAL(f.plugin->get_token_history(id).size(), 2u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( account_history ) {
   try {
      history_fixture f;
      app::ledger_api& api = f.node.api();
      ACTORS((alice)(bob));

      const token_id_type first = api.mint(alice_id);
      const token_id_type second = api.mint(bob_id);
      api.transfer_from(alice_id, alice_id, bob_id, first);
      api.transfer_from(bob_id, bob_id, alice_id, second);
      api.transfer_from(alice_id, alice_id, alice_id, second);

      // Newest first, a self-transfer listed once
      const std::vector<ownership_record> alice_history = f.plugin->get_account_history(alice_id, 10);
      BOOST_REQUIRE_EQUAL(alice_history.size(), 4u);
      BOOST_CHECK(alice_history[0].from == alice_id && alice_history[0].to == alice_id);
      BOOST_CHECK(alice_history[1].from == bob_id && alice_history[1].token_id == second);
      BOOST_CHECK(alice_history[2].from == alice_id && alice_history[2].token_id == first);
      BOOST_CHECK(alice_history[3].from.is_null() && alice_history[3].token_id == first);

      const std::vector<ownership_record> bob_history = f.plugin->get_account_history(bob_id, 2);
      BOOST_REQUIRE_EQUAL(bob_history.size(), 2u);
      BOOST_CHECK(bob_history[0].token_id == second && bob_history[0].to == alice_id);
      BOOST_CHECK(bob_history[1].token_id == first && bob_history[1].to == bob_id);

      ARTLEDGER_REQUIRE_THROW(f.plugin->get_account_history(address(), 10), fc::exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( account_history_limit_option ) {
   try {
      history_fixture f({"--artwork-history-max-per-account=2"});
      app::ledger_api& api = f.node.api();
      ACTORS((alice));

      api.mint(alice_id);
      api.mint(alice_id);
      const token_id_type last = api.mint(alice_id);

      const std::vector<ownership_record> history = f.plugin->get_account_history(alice_id, 100);
      BOOST_REQUIRE_EQUAL(history.size(), 2u);
      BOOST_CHECK_EQUAL(history[0].token_id, last);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( approval_history ) {
   try {
      history_fixture f;
      app::ledger_api& api = f.node.api();
      ACTORS((alice)(bob)(carol));

      const token_id_type id = api.mint(alice_id);
      api.approve(alice_id, bob_id, id);
      api.approve(alice_id, address(), id);
      api.set_approval_for_all(alice_id, carol_id, true);
      api.set_approval_for_all(alice_id, carol_id, false);

      const std::vector<approval_record> token_approvals = f.plugin->get_approval_history(id);
      BOOST_REQUIRE_EQUAL(token_approvals.size(), 2u);
      BOOST_CHECK(token_approvals[0].grantee == bob_id);
      BOOST_CHECK(token_approvals[0].granted);
      BOOST_CHECK(token_approvals[1].grantee.is_null());
      BOOST_CHECK(!token_approvals[1].granted);

      const std::vector<approval_record> by_owner = f.plugin->get_approvals_by_owner(alice_id);
      BOOST_REQUIRE_EQUAL(by_owner.size(), 4u);
      BOOST_CHECK(by_owner[2].for_all);
      BOOST_CHECK(by_owner[2].grantee == carol_id);
      BOOST_CHECK(by_owner[2].granted);
      BOOST_CHECK(by_owner[3].for_all);
      BOOST_CHECK(!by_owner[3].granted);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( shutdown_stops_recording ) {
   try {
      history_fixture f;
      app::ledger_api& api = f.node.api();
      ACTORS((alice));

      api.mint(alice_id);
      f.node.shutdown();
      api.mint(alice_id);

      BOOST_CHECK_EQUAL(f.plugin->get_ownership_records().size(), 1u);
      BOOST_CHECK_EQUAL(api.total_supply(), 2u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( receiver_removing_itself ) {
   try {
      history_fixture f;
      app::ledger_api& api = f.node.api();
      app::simulated_host& host = f.node.host();
      ACTORS((alice)(vault));

      const token_id_type first = api.mint(alice_id);
      const token_id_type second = api.mint(alice_id);

      host.register_receiver(vault_id, [&host, vault_id](const address&, token_id_type, const std::vector<char>&) {
         host.remove_receiver(vault_id);
         receiver_ack ack;
         ack.call_succeeded = true;
         ack.value = ARTLEDGER_RECEIVER_MAGIC;
         return ack;
      });

      api.safe_transfer_from(alice_id, alice_id, vault_id, first);
      BOOST_CHECK(!host.is_code_bearing(vault_id));

      api.safe_transfer_from(alice_id, alice_id, vault_id, second);
      BOOST_CHECK_EQUAL(api.balance_of(vault_id), 2u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( plugins_shut_down_once ) {
   try {
      counting_plugin::shutdowns = 0;
      {
         app::application node;
         node.register_plugin<counting_plugin>(true);
         node.initialize(boost::program_options::variables_map());
         node.startup();
         node.shutdown();
         node.shutdown();
      }
      BOOST_CHECK_EQUAL(counting_plugin::shutdowns, 1u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( application_configuration ) {
   try {
      history_fixture f({"--collection-name=Test Works", "--collection-symbol=TW",
                         "--ledger-address=0x00112233445566778899aabbccddeeff00112233"});

      BOOST_CHECK_EQUAL(f.node.api().name(), "Test Works");
      BOOST_CHECK_EQUAL(f.node.api().symbol(), "TW");
      BOOST_CHECK_EQUAL(f.node.chain_database().get_properties().ledger_address.to_string(),
                        "0x00112233445566778899aabbccddeeff00112233");
      BOOST_CHECK(f.node.is_plugin_enabled("artwork_history"));
      REQUIRE_EXCEPTION_WITH_TEXT(f.node.get_plugin("missing"), "Unknown plugin");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( uninitialized_application ) {
   try {
      app::application node;
      ARTLEDGER_REQUIRE_THROW(node.chain_database(), fc::exception);
      ARTLEDGER_REQUIRE_THROW(node.api(), fc::exception);
      ARTLEDGER_REQUIRE_THROW(node.enable_plugin("artwork_history"), fc::exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
