#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <string>
#include <unistd.h>

#include "fmt/format.h"

#include "config.hpp"
#include "dial_service.hpp"
#include "log.hpp"
#include "reference_app.hpp"

#define DEFAULT_CONFIG_PATH "./dialcast.json"

static constexpr std::string_view log_name {"Main"};

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

int main(int argc, char** argv)
{
    if(argc > 2)
    {
        fmt::print(stderr, "Usage: {} [config.json]\n", argv[0]);
        return EXIT_FAILURE;
    }
    const std::string config_path = (argc == 2) ? argv[1] : DEFAULT_CONFIG_PATH;

    // Blocked before any thread is spawned so only the handler receives them
    sigset_t sigset;
    block_signals(&sigset);

    dial::server_config config;
    try {
        config = dial::load_config(config_path);
    } catch(const std::exception& e) {
        logging::error(log_name, "{}", e.what());
        return EXIT_FAILURE;
    }
    logging::set_level(config.log_level);

    std::future<int> signal_handler = std::async(std::launch::async, [&sigset]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        return signum;
    });

    try {
        dial::dial_service service {config};

        dial::config_app_provider provider {config.apps};
        size_t registered = service.register_apps(provider);
        logging::info(log_name, "{} of {} configured app(s) registered", registered, config.apps.size());

        service.start();

        // Wait for signal and shut down all threads
        int signum = signal_handler.get();
        logging::info(log_name, "Received signal {}, shutting down...", signum);
        service.notify_all(dial::host_event {dial::host_event_type::host_closing, {}});
        service.shutdown();
    } catch(const std::exception& e) {
        logging::error(log_name, "{}", e.what());
        // Unblock the signal handler so the future can be joined
        kill(getpid(), SIGTERM);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
