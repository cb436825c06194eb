#include <atomic>
#include <csignal>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include <unistd.h>

#include "fmt/format.h"

#include "socketwrapper.hpp"

#include "config.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "http/request_handler.hpp"
#include "http/webserver.hpp"
#include "ssdp/broadcaster.hpp"
#include "ssdp/listener.hpp"
#include "ssdp/multicast_channel.hpp"

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

static void wake_webserver(uint16_t port)
{
    // The acceptor blocks in accept(), so connect once to let it see the run condition
    try {
        net::tcp_connection<net::ip_version::v4> sock {"127.0.0.1", port};
    } catch(std::runtime_error& err) {
        logging::debug("Webserver already closed: {}", err.what());
    }
}

int main(int argc, char** argv)
{
    config conf;
    try {
        conf = parse_arguments(argc, argv);
    } catch(const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n\n{}", e.what(), usage(argv[0]));
        return EXIT_FAILURE;
    }

    if(conf.show_help)
    {
        fmt::print("{}", usage(argv[0]));
        return EXIT_SUCCESS;
    }

    logging::set_level(conf.verbose ? logging::level::debug : logging::level::info);

    if(conf.local_ip.empty())
    {
        try {
            conf.local_ip = utils::get_local_ipaddr();
        } catch(const std::runtime_error& e) {
            logging::error("{}, pass one with --address", e.what());
            return EXIT_FAILURE;
        }
    }

    const std::string location = descriptor_location(conf);
    logging::info("Advertising device uuid:{} at {}", conf.identity.uuid, location);

    sigset_t sigset;
    std::atomic<bool> run_condition {true};
    block_signals(&sigset);

    std::unique_ptr<http::webserver> server;
    std::unique_ptr<ssdp::multicast_channel> channel;
    try {
        server = std::make_unique<http::webserver>(conf.webserver_port,
            http::request_handler {http::descriptor_asset {conf.descriptor_file}},
            http::webserver_options {conf.max_connections, conf.io_timeout});
        channel = std::make_unique<ssdp::multicast_channel>("0.0.0.0", SSDP_PORT, SSDP_MULTICAST_IP,
            conf.multicast_interface);
    } catch(const std::runtime_error& e) {
        logging::error("Startup failed: {}", e.what());
        return EXIT_FAILURE;
    }

    std::future<int> signal_handler = std::async(std::launch::async, [&run_condition, &sigset, &conf]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        run_condition.store(false);
        logging::info("Shutting down...");
        wake_webserver(conf.webserver_port);
        return signum;
    });

    std::vector<std::thread> worker;
    worker.reserve(1);
    worker.emplace_back([&run_condition, &server]() {
        server->serve(run_condition);
    });

    int exit_code = EXIT_SUCCESS;
    try {
        ssdp::broadcast_options options;
        options.targets.insert(options.targets.end(), conf.extra_services.begin(), conf.extra_services.end());
        ssdp::broadcast(*channel, conf.identity, location, options);

        ssdp::listener listener {*channel, conf.identity, location};
        listener.listen(run_condition);
    } catch(const std::exception& e) {
        logging::error("Discovery stopped: {}", e.what());
        exit_code = EXIT_FAILURE;
        kill(getpid(), SIGTERM);
    }

    // Wait for signal and shut down all threads
    signal_handler.get();
    for(auto& t : worker)
        t.join();

    return exit_code;
}
