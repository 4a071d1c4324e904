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

#include <artledger/app/ledger_api.hpp>
#include <artledger/app/plugin.hpp>
#include <artledger/app/simulated_host.hpp>

#include <boost/program_options.hpp>

#include <memory>

namespace artledger {
   namespace app {
      namespace detail { class application_impl; }

      /**
       * @brief Owns the execution host, the ledger database, its public API and the plugins
       *
       * Typical use: register plugins, collect program options, initialize() with the parsed
       * options, startup(), and shutdown() before destruction.
       */
      class application {
      public:
         application();
         ~application();

         /// Register the application options and those of every registered plugin
         void set_program_options(boost::program_options::options_description& cli,
                                  boost::program_options::options_description& cfg) const;

         /// Create the host and database from @p options, then initialize the enabled plugins
         void initialize(const boost::program_options::variables_map& options);

         void startup();

         void shutdown();

         template<typename PluginType>
         std::shared_ptr<PluginType> register_plugin(bool auto_load = false) {
            auto plug = std::make_shared<PluginType>(*this);
            add_available_plugin(plug);
            if (auto_load) {
               enable_plugin(plug->plugin_name());
            }
            return plug;
         }

         std::shared_ptr<abstract_plugin> get_plugin(const std::string& name) const;

         template<typename PluginType>
         std::shared_ptr<PluginType> get_plugin(const std::string& name) const {
            std::shared_ptr<abstract_plugin> abs_plugin = get_plugin(name);
            std::shared_ptr<PluginType> result = std::dynamic_pointer_cast<PluginType>(abs_plugin);
            FC_ASSERT(result != std::shared_ptr<PluginType>(), "Unable to load plugin '${p}'", ("p", name));
            return result;
         }

         void enable_plugin(const std::string& name);

         bool is_plugin_enabled(const std::string& name) const;

         /// @throws fc::assert_exception before initialize()
         chain::database& chain_database() const;

         simulated_host& host() const;

         ledger_api& api() const;

      private:
         void add_available_plugin(std::shared_ptr<abstract_plugin> p);

         std::unique_ptr<detail::application_impl> my;
      };
   }
}
