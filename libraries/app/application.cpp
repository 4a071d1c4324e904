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

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <boost/algorithm/string.hpp>

#include <map>
#include <set>

namespace artledger {
   namespace app {
      namespace bpo = boost::program_options;

      namespace detail {

         class application_impl {
         public:
            application_impl() {}

            ~application_impl() {
               // Plugins disconnect from the database before it goes away
               shutdown_plugins();
            }

            chain::ledger_properties read_ledger_properties(const bpo::variables_map& options) const {
               chain::ledger_properties props;
               if (options.count("ledger-address") > 0) {
                  props.ledger_address = address(options["ledger-address"].as<std::string>());
               } else {
                  props.ledger_address = address::from_name(ARTLEDGER_DEFAULT_LEDGER_SEED_NAME);
               }
               if (options.count("collection-name") > 0) {
                  props.name = options["collection-name"].as<std::string>();
               }
               if (options.count("collection-symbol") > 0) {
                  props.symbol = options["collection-symbol"].as<std::string>();
               }
               return props;
            }

            void read_enabled_plugins(const bpo::variables_map& options) {
               if (options.count("plugins") == 0) {
                  return;
               }
               const std::string& list = options["plugins"].as<std::string>();
               std::vector<std::string> names;
               boost::split(names, list, boost::is_any_of(" \t,"), boost::token_compress_on);
               for (const std::string& name : names) {
                  if (!name.empty()) {
                     enable_plugin(name);
                  }
               }
            }

            void enable_plugin(const std::string& name) {
               FC_ASSERT(_available_plugins.find(name) != _available_plugins.end(),
                         "Unknown plugin '${name}'", ("name", name));
               _enabled_plugins.insert(name);
            }

            void initialize(const bpo::variables_map& options) {
               FC_ASSERT(!_chain_db, "The application has already been initialized");

               const uint32_t genesis = options.count("genesis-timestamp") > 0
                                        ? options["genesis-timestamp"].as<uint32_t>()
                                        : ARTLEDGER_DEFAULT_GENESIS_TIMESTAMP;
               const uint32_t interval = options.count("block-interval") > 0
                                         ? options["block-interval"].as<uint32_t>()
                                         : ARTLEDGER_DEFAULT_BLOCK_INTERVAL;
               const chain::ledger_properties props = read_ledger_properties(options);

               _host = std::make_unique<simulated_host>(fc::time_point_sec(genesis), interval);
               _chain_db = std::make_unique<chain::database>(props, *_host);
               _api = std::make_unique<ledger_api>(*_chain_db);

               read_enabled_plugins(options);
               for (const std::string& name : _enabled_plugins) {
                  ilog("Initializing plugin ${name}", ("name", name));
                  _available_plugins[name]->plugin_initialize(options);
               }

               ilog("Ledger ${address} (${name}/${symbol}) initialized",
                    ("address", props.ledger_address)("name", props.name)("symbol", props.symbol));
            }

            void startup_plugins() {
               for (const std::string& name : _enabled_plugins) {
                  _available_plugins[name]->plugin_startup();
               }
            }

            void shutdown_plugins() {
               if (!_chain_db || _shut_down) {
                  return;
               }
               _shut_down = true;
               for (const std::string& name : _enabled_plugins) {
                  _available_plugins[name]->plugin_shutdown();
               }
            }

            std::map<std::string, std::shared_ptr<abstract_plugin>> _available_plugins;
            std::set<std::string> _enabled_plugins;

            std::unique_ptr<simulated_host> _host;
            std::unique_ptr<chain::database> _chain_db;
            std::unique_ptr<ledger_api> _api;

            bool _shut_down = false;
         };

      } // namespace detail

      application::application() : my(std::make_unique<detail::application_impl>()) {
      }

      application::~application() {
      }

      void application::set_program_options(bpo::options_description& cli,
                                            bpo::options_description& cfg) const {
         cfg.add_options()
            ("ledger-address", bpo::value<std::string>(),
             "Address of the ledger as 40 hex digits; derived from \"" ARTLEDGER_DEFAULT_LEDGER_SEED_NAME "\" when omitted")
            ("collection-name", bpo::value<std::string>()->default_value(ARTLEDGER_DEFAULT_COLLECTION_NAME),
             "Name of the token collection")
            ("collection-symbol", bpo::value<std::string>()->default_value(ARTLEDGER_DEFAULT_COLLECTION_SYMBOL),
             "Symbol of the token collection")
            ("genesis-timestamp", bpo::value<uint32_t>()->default_value(ARTLEDGER_DEFAULT_GENESIS_TIMESTAMP),
             "Timestamp of the first simulated block, in seconds since the epoch")
            ("block-interval", bpo::value<uint32_t>()->default_value(ARTLEDGER_DEFAULT_BLOCK_INTERVAL),
             "Seconds between simulated blocks")
            ("plugins", bpo::value<std::string>(),
             "Space-separated list of plugins to enable")
            ;

         for (const auto& entry : my->_available_plugins) {
            bpo::options_description plugin_cli(entry.first + " command line options");
            bpo::options_description plugin_cfg(entry.first + " options");
            entry.second->plugin_set_program_options(plugin_cli, plugin_cfg);
            if (!plugin_cli.options().empty()) {
               cli.add(plugin_cli);
            }
            if (!plugin_cfg.options().empty()) {
               cfg.add(plugin_cfg);
            }
         }
      }

      void application::initialize(const bpo::variables_map& options) {
         my->initialize(options);
      }

      void application::startup() {
         my->startup_plugins();
      }

      void application::shutdown() {
         my->shutdown_plugins();
      }

      std::shared_ptr<abstract_plugin> application::get_plugin(const std::string& name) const {
         auto itr = my->_available_plugins.find(name);
         FC_ASSERT(itr != my->_available_plugins.end(), "Unknown plugin '${name}'", ("name", name));
         return itr->second;
      }

      void application::enable_plugin(const std::string& name) {
         my->enable_plugin(name);
      }

      bool application::is_plugin_enabled(const std::string& name) const {
         return my->_enabled_plugins.find(name) != my->_enabled_plugins.end();
      }

      chain::database& application::chain_database() const {
         FC_ASSERT(my->_chain_db, "The application has not been initialized");
         return *my->_chain_db;
      }

      simulated_host& application::host() const {
         FC_ASSERT(my->_host, "The application has not been initialized");
         return *my->_host;
      }

      ledger_api& application::api() const {
         FC_ASSERT(my->_api, "The application has not been initialized");
         return *my->_api;
      }

      void application::add_available_plugin(std::shared_ptr<abstract_plugin> p) {
         const std::string name = p->plugin_name();
         FC_ASSERT(my->_available_plugins.find(name) == my->_available_plugins.end(),
                   "Plugin '${name}' is already registered", ("name", name));
         my->_available_plugins[name] = p;
      }
   }
}
