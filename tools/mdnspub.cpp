/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnspub/container/docker/docker_event_source.hpp"
#include "mdnspub/core/log.hpp"
#include "mdnspub/core/net/interfaces/adapter_selector.hpp"
#include "mdnspub/core/string.hpp"
#include "mdnspub/dnssd/responder.hpp"
#include "mdnspub/publisher/publication_table.hpp"
#include "mdnspub/publisher/reconciliation_engine.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <CLI/App.hpp>

#include <csignal>
#include <cstring>

namespace {

std::vector<std::string> without_empty(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    for (const auto& value : values) {
        const auto trimmed = mdnspub::string_trim(value);
        if (!trimmed.empty()) {
            result.emplace_back(trimmed);
        }
    }
    return result;
}

}  // namespace

/**
 * Publishes mDNS records for the containers on this host which carry an mdns.publish label, for as long as they run.
 * Exits with a non-zero code when the container runtime cannot be reached, so the restart policy of the host can take
 * over.
 */
int main(int const argc, char* argv[]) {
    mdnspub::set_log_level_from_env();

    CLI::App app {"Publishes mDNS records for labeled containers"};
    argv = app.ensure_utf8(argv);

    uint32_t ttl = 3600;
    app.add_option("--ttl", ttl, "TTL of the published records in seconds")->envname("TTL")->capture_default_str();

    std::string log_level = "INFO";
    app.add_option("--log-level", log_level, "TRACE, DEBUG, INFO, WARNING, ERROR, CRITICAL or OFF")
        ->envname("LOG_LEVEL")
        ->capture_default_str();

    std::vector<std::string> adapters;
    app.add_option("--adapters", adapters, "Comma separated adapters to publish on, all when empty")
        ->envname("ADAPTERS")
        ->delimiter(',');

    std::vector<std::string> excluded_nets;
    app.add_option("--excluded-nets", excluded_nets, "Comma separated networks (CIDR) whose addresses are not used")
        ->envname("EXCLUDED_NETS")
        ->delimiter(',');

    std::string local_domain = ".local";
    app.add_option("--local-domain", local_domain, "The domain published hosts must be in")
        ->envname("LOCAL_DOMAIN")
        ->capture_default_str();

    bool debug = false;
    app.add_flag("--debug", debug, "Add registration time and container id to the TXT records")->envname("DEBUG");

    uint32_t resync_interval = 300;
    app.add_option("--resync-interval", resync_interval, "Seconds between resyncs with the container list, 0 disables")
        ->envname("RESYNC_INTERVAL")
        ->capture_default_str();

    uint32_t responder_timeout = 5;
    app.add_option("--responder-timeout", responder_timeout, "Seconds allowed for a single responder call")
        ->envname("RESPONDER_TIMEOUT")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    uint32_t shutdown_grace = 5;
    app.add_option("--shutdown-grace", shutdown_grace, "Seconds allowed for unpublishing on shutdown")
        ->envname("SHUTDOWN_GRACE")
        ->capture_default_str();

    std::string docker_host = mdnspub::container::docker::DockerEventSource::k_default_docker_host;
    app.add_option("--docker-host", docker_host, "The Docker Engine API socket")
        ->envname("DOCKER_HOST")
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    if (!mdnspub::set_log_level(log_level)) {
        MDNSPUB_WARNING("Unknown log level {}", log_level);
    }

    adapters = without_empty(adapters);
    excluded_nets = without_empty(excluded_nets);

    const auto socket_path = mdnspub::container::docker::DockerEventSource::socket_path_from_docker_host(docker_host);
    if (!socket_path) {
        MDNSPUB_CRITICAL("Invalid docker host: {}", socket_path.error());
        return 1;
    }

    const auto excluded = mdnspub::AdapterSelector::parse_networks(excluded_nets);
    if (!excluded) {
        MDNSPUB_CRITICAL("Invalid excluded network: {}", excluded.error());
        return 1;
    }

    const auto all_adapters = mdnspub::NetworkInterface::get_all();
    if (!all_adapters) {
        MDNSPUB_CRITICAL("Failed to list network adapters: {}", std::strerror(all_adapters.error()));
        return 1;
    }

    const auto bindings = mdnspub::AdapterSelector::select(adapters, *excluded, *all_adapters);
    if (bindings.empty()) {
        MDNSPUB_CRITICAL("No adapter addresses to publish on");
        return 1;
    }

    for (const auto& binding : bindings) {
        MDNSPUB_INFO("Publishing on {}", binding.to_string());
    }

    try {
        boost::asio::io_context io_context;

        const auto responder = mdnspub::dnssd::Responder::create(io_context, bindings);
        if (responder == nullptr) {
            MDNSPUB_CRITICAL("No mDNS responder available");
            return 1;
        }

        mdnspub::container::docker::DockerEventSource::Configuration source_config;
        source_config.socket_path = *socket_path;
        mdnspub::container::docker::DockerEventSource source(io_context, source_config);

        mdnspub::ReconciliationEngine::Configuration engine_config;
        engine_config.label_parser.local_domain = local_domain;
        engine_config.ttl_seconds = ttl;
        engine_config.debug = debug;
        engine_config.resync_interval = std::chrono::seconds(resync_interval);
        engine_config.responder_timeout = std::chrono::seconds(responder_timeout);
        engine_config.shutdown_grace = std::chrono::seconds(shutdown_grace);

        mdnspub::PublicationTable table;
        mdnspub::ReconciliationEngine engine(io_context, source, *responder, table, engine_config);

        int exit_code = 0;

        auto shutdown = [&engine, &io_context] {
            engine.async_shutdown([&io_context] {
                io_context.stop();
            });
        };

        engine.on<mdnspub::container::SourceError>([&](const mdnspub::container::SourceError&) {
            exit_code = 1;
            shutdown();
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, const int signal_number) {
            if (ec) {
                return;
            }
            MDNSPUB_INFO("Received signal {}, shutting down", signal_number);
            shutdown();
        });

        MDNSPUB_INFO("Watching {} for containers labeled {}", *socket_path, source_config.publish_label);
        engine.start();
        io_context.run();

        return exit_code;
    }
    CATCH_LOG_UNCAUGHT_EXCEPTIONS

    return 1;
}
