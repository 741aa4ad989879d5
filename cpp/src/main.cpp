#include "chatpool/account/Reports.hpp"
#include "chatpool/api/ChatError.hpp"
#include "chatpool/client/Client.hpp"
#include "chatpool/config/ClientConfig.hpp"
#include "chatpool/util/JsonUtil.hpp"
#include "chatpool/util/Logging.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using namespace chatpool;

struct CliOptions {
    std::filesystem::path configPath{"data/chatpool.json"};
    std::optional<std::filesystem::path> accountsPath;
    std::vector<std::string> attachments;
    std::string message;
    bool showReport{true};
};

void printUsage(std::ostream& out) {
    out << "Usage: chatpool_cli [--config path] [--accounts path] [--attach path-or-url]... [--no-report] message\n";
}

std::optional<CliOptions> parseArguments(int argc, char** argv) {
    CliOptions options;
    std::vector<std::string> words;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            auto value = next();
            if (!value) return std::nullopt;
            options.configPath = *value;
        } else if (arg == "--accounts") {
            auto value = next();
            if (!value) return std::nullopt;
            options.accountsPath = *value;
        } else if (arg == "--attach") {
            auto value = next();
            if (!value) return std::nullopt;
            options.attachments.push_back(*value);
        } else if (arg == "--no-report") {
            options.showReport = false;
        } else {
            words.emplace_back(arg);
        }
    }
    for (const auto& word : words) {
        if (!options.message.empty()) {
            options.message += ' ';
        }
        options.message += word;
    }
    if (options.message.empty()) {
        std::cerr << "A message is required\n";
        return std::nullopt;
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(std::cerr);
        return 2;
    }

    util::initLogging(util::LogLevel::info);
    auto config = config::loadClientConfig(options->configPath);
    util::initLogging(config.logLevel);
    if (options->accountsPath) {
        config.accounts = config::loadAccounts(*options->accountsPath);
    }
    if (config.accounts.empty()) {
        util::log(util::LogLevel::error, "No accounts configured; set \"accounts\" in " + options->configPath.string() +
                                             ", pass --accounts or CHATPOOL_ACCOUNTS_FILE");
        return 1;
    }

    boost::asio::io_context io;
    auto guard = boost::asio::make_work_guard(io);
    unsigned int ioThreadsCount = std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> ioThreads;
    ioThreads.reserve(ioThreadsCount);
    for (unsigned int i = 0; i < ioThreadsCount; ++i) {
        ioThreads.emplace_back([&io]() { io.run(); });
    }

    int exitCode = 0;
    {
        client::Client chatClient{io, std::move(config)};
        try {
            client::ChatRequest request;
            request.message = options->message;
            request.attachments = options->attachments;
            chatClient.chatStream(request, [](const std::string& chunk) { std::cout << chunk << std::flush; });
            std::cout << std::endl;
        } catch (const api::ChatError& ex) {
            util::log(util::LogLevel::error, std::string{"Chat failed ["} + api::toString(ex.kind()) + "]: " + ex.what());
            exitCode = 1;
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, std::string{"Chat failed: "} + ex.what());
            exitCode = 1;
        }

        if (options->showReport) {
            try {
                boost::json::object summary;
                summary["status"] = account::toJson(chatClient.accountStatus());
                summary["performance"] = account::toJson(chatClient.performanceReport());
                std::cout << util::stringifyJson(summary) << std::endl;
            } catch (const std::exception& ex) {
                util::log(util::LogLevel::warn, std::string{"Unable to build report: "} + ex.what());
            }
        }
        chatClient.shutdown();
    }

    guard.reset();
    io.stop();
    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    return exitCode;
}
