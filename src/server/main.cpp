#include "bpf/libbpf_module.hpp"
#include "config/config.hpp"
#include "exporter/dump.hpp"
#include "parse/args.hpp"

#include <chrono>
#include <prometheus/exposer.h>
#include <signal.h>
#include <sstream>
#include <stdlib.h>
#include <thread>

bool enable_bpf_debug = false;

std::string config_path;

int port = 0;

static volatile sig_atomic_t exiting = 0;

static void sig_handler(int sig) {
    exiting = 1;
}

static int libbpf_print_fn(enum libbpf_print_level level, const char* format, va_list args) {
    if (level == LIBBPF_DEBUG && !enable_bpf_debug) return 0;

    return vfprintf(stderr, format, args);
}

int main(int argc, char* argv[]) {
    error_t err = parse_args(argc, argv);

    if (err) return EXIT_FAILURE;

    libbpf_set_print(libbpf_print_fn);

    if (config_path.length() == 0) {
        Log::error("Config file is missing.\n");
        return EXIT_FAILURE;
    }

    Log::log("Config file: ", std::filesystem::absolute(config_path).string(), ".\n");

    Config config;

    err = read_config(config_path, config);

    if (err) return EXIT_FAILURE;

    if (port) config.port = port;

    // 接收中断请求 ( ctrl + c )
    signal(SIGINT, sig_handler);
    signal(SIGTERM, sig_handler);

    LibbpfLoader loader;
    Attacher     attacher(loader);

    // 加载 bpf 程序并插桩, 任何失败都不进入服务状态
    err = attacher.attach(config.programs);

    if (err) return EXIT_FAILURE;

    DecoderSet decoders;

    auto exporter = std::make_shared<Exporter>(config.programs, attacher, decoders);

    auto descs = exporter->describe();

    for (auto it = descs.begin(); it != descs.end(); it++) {
        Log::log("Metric ", (*it)->name, "\n");
    }

    std::ostringstream oss;

    oss << config.address << ":" << config.port;

    std::unique_ptr<prometheus::Exposer> exposer;

    try {
        exposer = std::make_unique<prometheus::Exposer>(oss.str());
    } catch (const std::exception& e) {
        Log::error("Failed to listen on ", oss.str(), ": ", e.what(), "\n");
        return EXIT_FAILURE;
    }

    // ask the exposer to scrape the exporter on incoming HTTP requests
    exposer->RegisterCollectable(exporter);

    std::cout << "Server is running at " << BLUE("http://") << oss.str() << "/metrics\n";

    httplib::Server svr;
    std::thread     tables;

    if (config.tables_port) {
        svr.Get("/tables", [&exporter](const httplib::Request& req, httplib::Response& res) {
            tables_handler(*exporter, req, res);
        });

        if (!svr.bind_to_port(config.address, config.tables_port)) {
            Log::error("Failed to listen on ", config.address, ":", config.tables_port, "\n");
            return EXIT_FAILURE;
        }

        tables = std::thread([&svr]() { svr.listen_after_bind(); });

        std::cout << "Tables are available at " << BLUE("http://") << config.address << ":" << config.tables_port
                  << "/tables\n";
    }

    while (!exiting) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (tables.joinable()) {
        svr.stop();
        tables.join();
    }

    return EXIT_SUCCESS;
}
