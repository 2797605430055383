#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "socketwrapper.hpp"

#include "artist_images.hpp"
#include "cast_transport.hpp"
#include "config.hpp"
#include "control_api.hpp"
#include "event_loop.hpp"
#include "http/socket_client.hpp"
#include "http/webserver.hpp"
#include "lms_source.hpp"
#include "log.hpp"
#include "playback_bridge.hpp"
#include "receiver_session.hpp"
#include "tls_link.hpp"
#include "utils.hpp"

static constexpr const char* default_config_path = "./lms_cast.json";

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

int main(int argc, char** argv)
{
    utils::relay_config config;
    try {
        config = utils::load_config(argc > 1 ? argv[1] : default_config_path);
        utils::apply_env_overrides(config);
        utils::log::set_level(utils::log::parse_level(config.log_level));
    } catch(const std::exception& e) {
        utils::log::error("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    sigset_t sigset;
    std::atomic<bool> run_condition {true};
    utils::ignore_broken_pipe();
    block_signals(&sigset);
    const uint16_t control_port = config.control_port;
    std::future<int> signal_handler = std::async(std::launch::async, [&run_condition, &sigset, control_port]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        run_condition.store(false);
        utils::log::info("Shutting down...");

        // Wakes up the web server waiting in accept
        try {
            net::tcp_connection<net::ip_version::v4> sock {"127.0.0.1", control_port};
        } catch(const std::runtime_error& err) {
            utils::log::debug("Web server already closed: {}", err.what());
        }

        return signum;
    });

    utils::event_loop loop;
    http::socket_client client {config.ssl.cert, config.ssl.key, config.timing.http_timeout};

    googlecast::cast_transport transport {loop, googlecast::tls_link::factory(config.ssl.cert, config.ssl.key),
        config.timing.heartbeat_interval};
    googlecast::receiver_session session {transport, loop,
        googlecast::receiver_app {config.receiver.app_id, config.receiver.nspace, config.receiver.url},
        config.timing.launch_timeout};

    lms::json_rpc_source source {loop, client, lms::server_address {config.lms.host, config.lms.port}};

    std::vector<std::unique_ptr<artwork::image_provider>> providers;
    providers.push_back(std::make_unique<artwork::audiodb_provider>(client, config.artwork.audiodb_key));
    providers.push_back(std::make_unique<artwork::deezer_provider>(client));
    providers.push_back(std::make_unique<artwork::fanart_provider>(client, config.artwork.fanart_key));
    artwork::artist_image_cache images {loop, std::move(providers),
        artwork::cache_options {config.artwork.ttl, config.artwork.max_images}};

    relay::playback_bridge bridge {loop, source, session, &images,
        relay::bridge_options {config.timing.poll_interval, config.timing.pause_timeout, config.chromecast.enabled}};
    control::control_api api {loop, session, bridge};

    utils::log::info("LMS server {}:{}, control api on http://{}:{}/api/status", config.lms.host, config.lms.port,
        utils::get_local_ipaddr(), config.control_port);

    loop.post([&]() {
        if(!config.chromecast.ip.empty())
        {
            session.set_device(googlecast::device_endpoint {config.chromecast.ip, config.chromecast.port});
            api.set_device_name(config.chromecast.name);
        }
        else
        {
            utils::log::warn("[Chromecast] No device configured, waiting for POST /api/chromecast");
        }

        if(!config.player.id.empty())
            bridge.set_preferred_player(config.player.id, config.player.name);
        bridge.start();
    });

    std::vector<std::thread> worker;
    worker.reserve(1);
    try {
        auto server = std::make_shared<http::webserver>(config.control_port,
            [&api](const http::request& req) { return api.dispatch(req); });
        worker.emplace_back([server, &run_condition]() {
            server->serve(run_condition);
        });
    } catch(const std::runtime_error& e) {
        utils::log::error("[Control] Could not listen on port {}: {}", config.control_port, e.what());
    }

    // Wait for signal and shut down all threads
    signal_handler.get();
    for(auto& t : worker)
        t.join();

    std::promise<void> stopped;
    loop.post([&bridge, &session, &stopped]() {
        bridge.stop();
        session.disconnect();
        stopped.set_value();
    });
    stopped.get_future().wait_for(std::chrono::seconds {2});
    loop.shutdown();

    return EXIT_SUCCESS;
}
