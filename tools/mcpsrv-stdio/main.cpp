// ─────────────────────────────────────────────────────────────────────────────
// mcpsrv-stdio - MCP server over newline-delimited stdio
// ─────────────────────────────────────────────────────────────────────────────
// Reads one JSON-RPC envelope per line from stdin and writes one response
// per line to stdout. Notifications produce no output. Logs go to stderr or
// to --log-file.
//
// Usage:
//   mcpsrv-stdio --tools config/tools.json --resources config/resources.json \
//                --name marketplace-mcp --stub-tools
//
//   MCPSRV_TOOLS_FILE=config/tools.json mcpsrv-stdio --log-level debug

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <cxxopts.hpp>

#include "mcpsrv/log/spdlog_logger.hpp"
#include "mcpsrv/server/mcp_server.hpp"
#include "mcpsrv/server/server_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace mcpsrv;

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

std::shared_ptr<SpdlogLogger> make_logger(const cxxopts::ParseResult& result, LogLevel level) {
    if (result.count("log-file") > 0) {
        return make_spdlog_file_logger(result["log-file"].as<std::string>(), level);
    }
    return make_spdlog_async_logger(level);
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpsrv-stdio", "MCP server over newline-delimited stdio");

    options.add_options()
        ("t,tools", "Tool definitions file (or MCPSRV_TOOLS_FILE)", cxxopts::value<std::string>())
        ("r,resources", "Resource definitions file (or MCPSRV_RESOURCES_FILE)", cxxopts::value<std::string>())
        ("n,name", "Server name reported by initialize", cxxopts::value<std::string>()->default_value("mcpserver"))
        ("server-version", "Server version reported by initialize", cxxopts::value<std::string>()->default_value("1.0.0"))
        ("l,log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Write logs to this file instead of stderr", cxxopts::value<std::string>())
        ("j,threads", "Worker threads handling requests", cxxopts::value<std::size_t>()->default_value("4"))
        ("stub-tools", "Answer every declared tool with a stub result")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help") > 0) {
            std::cout << options.help() << "\n";
            return 0;
        }

        const auto level = parse_log_level(result["log-level"].as<std::string>());
        if (!level.has_value()) {
            std::cerr << "Error: unknown log level '" << result["log-level"].as<std::string>() << "'\n";
            return 1;
        }
        auto logger = make_logger(result, *level);

        ServerConfig config;
        config.with_server_info(result["name"].as<std::string>(), result["server-version"].as<std::string>())
              .with_logger(logger);

        const std::string tools_file = result.count("tools") > 0
            ? result["tools"].as<std::string>()
            : env_or("MCPSRV_TOOLS_FILE", "");
        const std::string resources_file = result.count("resources") > 0
            ? result["resources"].as<std::string>()
            : env_or("MCPSRV_RESOURCES_FILE", "");
        if (tools_file.empty() == false) {
            config.with_tools_file(tools_file);
        }
        if (resources_file.empty() == false) {
            config.with_resources_file(resources_file);
        }

        auto server = McpServer::create(config);
        if (!server) {
            std::cerr << "Error: " << server.error().what() << "\n";
            return 1;
        }
        if (result.count("stub-tools") > 0) {
            (*server)->register_stub_tools();
        }

        const std::size_t threads = std::max<std::size_t>(1, result["threads"].as<std::size_t>());
        logger->info_fmt("serving {} tools and {} resources on stdio with {} workers",
            (*server)->registry().tools().size(),
            (*server)->registry().resources().size(),
            threads);

        asio::thread_pool pool(threads);
        std::mutex stdout_mutex;
        McpServer& dispatcher = **server;

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            asio::post(pool, [&dispatcher, &stdout_mutex, body = std::move(line)]() {
                const auto response = dispatcher.handle_raw(body, RequestContext::object());
                if (response.is_notification()) {
                    return;
                }
                const std::string encoded = response.serialize();
                std::lock_guard<std::mutex> lock(stdout_mutex);
                std::cout << encoded << '\n' << std::flush;
            });
            line.clear();
        }

        pool.join();
        logger->info("stdin closed, shutting down");
        logger->flush();
        return 0;
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << options.help() << "\n";
        return 1;
    }
}
