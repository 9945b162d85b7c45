/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <functional>

#include <seastar/core/app-template.hh>
#include <seastar/core/abort_source.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/reactor.hh>
#include <seastar/core/thread.hh>
#include <seastar/util/defer.hh>
#include <seastar/http/httpd.hh>

#include "supervisor.hh"
#include "version.hh"
#include "db/config.hh"
#include "db/schema_storage.hh"
#include "db/local_schema.hh"
#include "gms/gossiper.hh"
#include "gms/versioned_value.hh"
#include "message/messaging_service.hh"
#include "service/migration_manager.hh"
#include "api/api_init.hh"
#include "utils/runtime.hh"
#include "utils/UUID_gen.hh"
#include "log.hh"

#include <boost/program_options.hpp>
#include <fmt/ostream.h>
#include <iostream>

logging::logger startlog("init");

namespace bpo = boost::program_options;

// Must live in a seastar::thread
class stop_signal {
    bool _caught = false;
    condition_variable _cond;
    abort_source _abort_source;
private:
    void signaled() {
        if (_caught) {
            return;
        }
        _caught = true;
        _cond.broadcast();
        _abort_source.request_abort();
    }
public:
    stop_signal() {
        engine().handle_signal(SIGINT, [this] { signaled(); });
        engine().handle_signal(SIGTERM, [this] { signaled(); });
    }
    ~stop_signal() {
        // There's no way to unregister a handler yet, so register a no-op handler instead.
        engine().handle_signal(SIGINT, [] {});
        engine().handle_signal(SIGTERM, [] {});
    }
    future<> wait() {
        return _cond.wait([this] { return _caught; });
    }
    bool stopping() const {
        return _caught;
    }
    abort_source& as_local_abort_source() { return _abort_source; }
};

static future<>
read_config(bpo::variables_map& opts, db::config& cfg) {
    sstring file;

    if (opts.contains("options-file")) {
        file = opts["options-file"].as<sstring>();
    } else {
        file = db::config::get_conf_sub("schemasync.yaml").string();
    }
    return cfg.read_from_file(file, [](auto & opt, auto & msg, auto status) {
        auto level = log_level::warn;
        if (status.value_or(db::config::value_status::Invalid) == db::config::value_status::Used) {
            level = log_level::error;
        }
        startlog.log(level, "{} : {}", msg, opt);
    }).handle_exception([file](auto ep) {
        startlog.error("Could not read configuration file {}: {}", file, ep);
        return make_exception_future<>(ep);
    });
}

template <typename Func>
static auto defer_verbose_shutdown(const char* what, Func&& func) {
    auto vfunc = [what, func = std::forward<Func>(func)] () mutable noexcept {
        startlog.info("Shutting down {}", what);
        try {
            func();
            startlog.info("Shutting down {} was successful", what);
        } catch (...) {
            startlog.error("Unexpected error shutting down {}: {}: exiting", what, std::current_exception());
            // Call _exit() rather than exit() to exit immediately
            // without running the remaining shutdown steps.
            _exit(255);
        }
    };

    return deferred_action(std::move(vfunc));
}

int main(int ac, char** av) {
  try {
    runtime::init_uptime();
    std::setvbuf(stdout, nullptr, _IOLBF, 1000);
    app_template::config app_cfg;
    app_cfg.name = "schemasync";
    app_cfg.description =
R"(schemasync - keeps the schema definitions of a cluster in agreement

Every node advertises the version of the schema it holds on the membership
feed, pulls the schema of peers advertising another version and pushes the
changes made locally to its live peers.
)";
    app_cfg.auto_handle_sigint_sigterm = false;
    app_template app(std::move(app_cfg));

    auto cfg = make_lw_shared<db::config>();
    auto init = app.get_options_description().add_options();

    init("version", bpo::bool_switch(), "print version number and exit");
    init("options-file", bpo::value<sstring>(), "configuration file (i.e. <SCHEMASYNC_CONF>/schemasync.yaml)");
    cfg->add_options(init);

    return app.run(ac, av, [&] () -> future<int> {
        auto&& opts = app.configuration();

        if (opts["version"].as<bool>()) {
            fmt::print("{}\n", version::release());
            return make_ready_future<int>(0);
        }

        return seastar::async([cfg, &opts] {
            ::stop_signal stop_signal;
            read_config(opts, *cfg).get();

            startlog.info("schemasync version {} starting, cluster {}", version::release(), cfg->cluster_name());

            if (this_shard_id() != 0) {
                throw std::logic_error("the node must be started on shard 0");
            }

            auto listen = gms::inet_address::lookup(cfg->listen_address()).get();
            auto broadcast = cfg->broadcast_address().empty()
                    ? listen : gms::inet_address::lookup(cfg->broadcast_address()).get();
            auto api_addr = gms::inet_address::lookup(cfg->api_address().empty() ? cfg->listen_address() : cfg->api_address()).get();

            supervisor::notify("loading schema");
            db::file_schema_storage storage(std::filesystem::path(cfg->schema_directory()));
            db::local_schema schema(storage);
            schema.load().get();

            supervisor::notify("starting messaging service");
            netw::messaging_service::config mscfg;
            mscfg.ip = listen;
            mscfg.broadcast_address = broadcast;
            mscfg.port = cfg->storage_port();
            auto messaging = make_shared<netw::messaging_service>(std::move(mscfg));
            auto stop_messaging = defer_verbose_shutdown("messaging service", [&messaging] {
                messaging->shutdown().get();
                messaging->stop().get();
            });

            supervisor::notify("starting gossiper");
            gms::gossiper gossiper(broadcast, gms::gossip_config{cfg->cluster_name()});
            auto stop_gossiper = defer_verbose_shutdown("gossiper", [&gossiper] {
                gossiper.shutdown().get();
                gossiper.stop().get();
            });

            supervisor::notify("starting migration manager");
            service::migration_notifier mm_notifier;
            service::migration_manager_config mmcfg;
            mmcfg.migration_delay = std::chrono::milliseconds(cfg->migration_delay_in_ms());
            mmcfg.schema_pull_timeout = std::chrono::milliseconds(cfg->schema_pull_timeout_in_ms());
            mmcfg.max_schema_batch_records = cfg->max_schema_batch_records();
            auto mm = make_shared<service::migration_manager>(mm_notifier, gossiper, *messaging, schema, std::move(mmcfg));
            mm->start().get();
            auto stop_migration_manager = defer_verbose_shutdown("migration manager", [&mm] {
                mm->stop().get();
            });

            auto host_id = utils::UUID_gen::get_name_UUID(fmt::format("{}/{}", cfg->cluster_name(), broadcast));
            gossiper.start({
                {gms::application_state::HOST_ID, gms::versioned_value::host_id(host_id)},
                {gms::application_state::RELEASE_VERSION, gms::versioned_value::release_version()},
                {gms::application_state::NET_VERSION, gms::versioned_value::network_version(messaging->current_version())},
                {gms::application_state::TOKENS, gms::versioned_value::tokens(cfg->initial_token())},
                {gms::application_state::STATUS, gms::versioned_value::normal(cfg->initial_token())},
                {gms::application_state::SCHEMA, gms::versioned_value::schema(schema.get_version())},
            }).get();

            messaging->start_listen().get();

            supervisor::notify("starting API server");
            api::http_context ctx;
            ctx.http_server.start("API").get();
            auto stop_http_server = defer_verbose_shutdown("API server", [&ctx] {
                ctx.http_server.stop().get();
            });
            api::set_server_init(ctx).get();
            api::set_server_gossip(ctx, gossiper).get();
            api::set_server_migration_manager(ctx, *mm).get();
            auto unset_api = defer_verbose_shutdown("API routes", [&ctx] {
                api::unset_server_migration_manager(ctx).get();
                api::unset_server_gossip(ctx).get();
            });
            ctx.http_server.listen(socket_address(api_addr.addr(), cfg->api_port())).get();
            startlog.info("API server listening on {}:{} ...", api_addr, cfg->api_port());

            supervisor::notify("serving", true);
            startlog.info("Schema version is {}", schema.get_version());

            stop_signal.wait().get();
            startlog.info("Signal received; shutting down");
        }).then([] {
            startlog.info("schemasync shutdown complete.");
            return 0;
        });
    });
  } catch (...) {
      // reactor may not have been initialized, so can't use logger
      fmt::print(std::cerr, "FATAL: Exception during startup, aborting: {}\n", std::current_exception());
      return 7; // 1 has a special meaning for upstart
  }
}
