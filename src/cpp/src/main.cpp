#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include "ptzgw/camera_session.hpp"
#include "ptzgw/config.hpp"
#include "ptzgw/control_server.hpp"
#include "ptzgw/gateway.hpp"
#include "ptzgw/logging.hpp"
#include "ptzgw/onvif_device.hpp"
#include "ptzgw/remote_session.hpp"
#include "ptzgw/websocket_control_transport.hpp"
#include "ptzgw/websocket_remote_transport.hpp"

namespace {

struct Args {
    std::string config_path;
    int port = -1;          // -1 means not set
    std::string log_level;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [OPTIONS]\n"
        << "\n"
        << "Relay the active Monocle camera to local PTZ controllers\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config PATH        Config file (default: ~/.monocle/config.json,\n"
        << "                           then ./config.json)\n"
        << "  -p, --port PORT          Local controller port (default: 8080)\n"
        << "      --log-level LEVEL    trace, debug, info, warn, error, critical, off\n"
        << "  -h, --help               Show this help message\n";
}

bool parse_args(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return true;
        } else if (arg == "-c" || arg == "--config") {
            if (++i >= argc) {
                std::cerr << "Error: --config requires an argument\n";
                return false;
            }
            args.config_path = argv[i];
        } else if (arg == "-p" || arg == "--port") {
            if (++i >= argc) {
                std::cerr << "Error: --port requires an argument\n";
                return false;
            }
            char* end = nullptr;
            long port = std::strtol(argv[i], &end, 10);
            if (*end != '\0' || port < 1 || port > 65535) {
                std::cerr << "Error: invalid port '" << argv[i] << "'\n";
                return false;
            }
            args.port = static_cast<int>(port);
        } else if (arg == "--log-level") {
            if (++i >= argc) {
                std::cerr << "Error: --log-level requires an argument\n";
                return false;
            }
            args.log_level = argv[i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void print_banner() {
    spdlog::info("-------------------------------------------------");
    spdlog::info("PTZ GATEWAY SERVICE STARTED");
    spdlog::info("-------------------------------------------------");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    ptzgw::Config config(args.config_path);
    try {
        config.load();
        if (args.port > 0) {
            config.set(ptzgw::CFG_PORT, args.port);
        }
        if (!args.log_level.empty()) {
            config.set(ptzgw::CFG_LOG_LEVEL, args.log_level);
        }
        config.validate();
        ptzgw::init_logging(config.log_level());
    } catch (const ptzgw::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    try {
        boost::asio::io_context ioc;
        boost::asio::thread_pool device_worker(1);

        ptzgw::WebSocketRemoteTransport remote_transport(ioc);
        ptzgw::WebSocketControlTransport control_transport(ioc);

        ptzgw::RemoteSessionClient remote(ioc, remote_transport, config.remote_options());
        ptzgw::LocalControlServer server(control_transport, config.port());
        ptzgw::CameraSession session(ptzgw::OnvifDevice::factory(),
                                     config.device_username(),
                                     config.device_password());

        ptzgw::Gateway gateway(ioc.get_executor(), device_worker.get_executor(),
                               remote, server, session);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            spdlog::info("Received signal {}; shutting down", signo);
            // run() returns once the close handshakes finish.
            gateway.stop();
            device_worker.stop();
        });

        spdlog::info("Using config {}", config.path());
        gateway.start();
        print_banner();

        ioc.run();
        device_worker.join();
    } catch (const ptzgw::GatewayError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
        return 1;
    }

    return 0;
}
