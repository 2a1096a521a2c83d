#include "chunkrelay/core/command_handler.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include "chunkrelay/network/http_chunk_source.hpp"
#include "chunkrelay/storage/memory_sink.hpp"
#include "chunkrelay/storage/table.hpp"
#include "chunkrelay/transfer/performance_monitor.hpp"
#include "chunkrelay/transfer/transfer_manager.hpp"
#include <fmt/format.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace chunkrelay::core {

using transfer::TransferResult;
using utils::StringUtils;
using utils::TimeUtils;

std::unique_ptr<Services> Services::from_config() {
    auto& config = Config::instance();
    auto services = std::make_unique<Services>();

    services->http_ = std::make_unique<network::CurlHttpClient>(network::CurlHttpClient::Options::from_config());
    services->sinks_ = std::make_unique<storage::SinkFactory>(*services->http_,
                                                              storage::SinkFactory::Settings::from_config());
    services->options_ = transfer::TransferOptions::from_config();
    services->graph_base_url_ = config.get_string("graph.base_url", network::GraphMetadataSource::DEFAULT_BASE_URL);

    auto token = config.get_string("auth.token");
    auto tenant_id = config.get_string("auth.tenant_id");
    auto client_id = config.get_string("auth.client_id");
    auto client_secret = config.get_string("auth.client_secret");

    if (!token.empty()) {
        services->tokens_ = std::make_unique<network::StaticTokenProvider>(token);
    } else if (!tenant_id.empty() || !client_id.empty() || !client_secret.empty()) {
        if (tenant_id.empty() || client_id.empty() || client_secret.empty()) {
            throw std::runtime_error("auth.tenant_id, auth.client_id and auth.client_secret must be set together");
        }
        services->tokens_ = std::make_unique<network::ClientSecretTokenProvider>(
            *services->http_, tenant_id, client_id, client_secret);
    }

    auto journal_path = config.get_string("journal.path");
    if (!journal_path.empty()) {
        auto journal = std::make_unique<storage::TransferJournal>(utils::FileUtils::expand_user(journal_path));
        if (journal->initialize()) {
            services->journal_ = std::move(journal);
        } else {
            LOG_WARN("Transfer history is unavailable, continuing without it");
        }
    }

    return services;
}

TransferResult Services::tokens(network::TokenProvider*& provider) {
    if (!tokens_) {
        return TransferResult::permanent(
            "No credentials configured: set auth.token, or auth.tenant_id, auth.client_id and auth.client_secret");
    }
    provider = tokens_.get();
    return TransferResult::ok();
}

std::unique_ptr<network::GraphMetadataSource> Services::graph(network::TokenProvider& tokens,
                                                              const std::string& hostname,
                                                              const std::string& site_path) {
    return std::make_unique<network::GraphMetadataSource>(*http_, tokens, hostname, site_path, graph_base_url_,
                                                          options_.metadata_retry);
}

CommandResult CommandHandler::run_transfer(Services& services,
                                           transfer::TransferSpec spec,
                                           transfer::MetadataSource& metadata,
                                           std::unique_ptr<transfer::ChunkSource> source) {
    spec.chunk_size = services.options().chunk_size;
    spec.buffer_capacity = services.options().buffer_chunks;
    spec.expected_digest = context_.expected_digest;

    transfer::TransferJob job;
    job.metadata = &metadata;
    job.source = std::move(source);

    auto created = services.sinks().create(spec.destination, job.sink);
    if (!created) {
        return CommandResult::error(created.message);
    }
    job.spec = std::move(spec);

    transfer::ConsoleProgressReporter console(std::cout);
    transfer::LoggingProgressReporter logging;
    transfer::PerformanceMonitor monitor;

    console.set_monitor(&monitor);

    transfer::CompositeProgressReporter progress;
    progress.add(&monitor);
    if (context_.quiet) {
        progress.add(&logging);
    } else {
        progress.add(&console);
    }

    std::optional<transfer::TransferOutcome> outcome;
    {
        transfer::TransferManager manager(services.options(), 1, services.journal(), &progress);

        std::string session_id;
        auto submitted = manager.submit(std::move(job), session_id);
        if (!submitted) {
            return CommandResult::error(submitted.message);
        }

        std::stop_callback on_interrupt(context_.stop, [&manager] { manager.cancel_all(); });
        outcome = manager.wait(session_id);

        if (auto forgotten = manager.forget(session_id); !forgotten) {
            LOG_WARN("Session {} still held by the manager: {}", session_id, forgotten.message);
        }
    }

    if (!context_.quiet) {
        console.finish();
    }

    if (!outcome) {
        return CommandResult::error("Transfer vanished before finishing");
    }

    if (!outcome->success()) {
        return CommandResult::error(fmt::format("Transfer {}: {}", transfer::to_string(outcome->state),
                                                outcome->error.describe()),
                                    outcome->state == transfer::TransferState::CANCELLED ? 130 : 1);
    }

    std::cout << "Saved " << StringUtils::format_bytes(outcome->bytes_transferred)
              << " in " << StringUtils::format_duration(outcome->elapsed)
              << " (" << StringUtils::format_bytes(static_cast<size_t>(outcome->average_throughput_bps)) << "/s)\n";
    std::cout << "  Session: " << outcome->session_id << "\n";
    std::cout << "  BLAKE2b: " << outcome->digest << "\n";
    if (outcome->total_backoff.count() > 0) {
        std::cout << "  Waited on retries: " << StringUtils::format_duration(outcome->total_backoff) << "\n";
    }

    return CommandResult::ok("Transfer completed");
}

CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 5) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& hostname = args[1];
    const auto& site_path = args[2];
    const auto& file_path = args[3];
    const auto& destination = args[4];

    try {
        auto services = Services::from_config();

        network::TokenProvider* tokens = nullptr;
        auto auth = services->tokens(tokens);
        if (!auth) {
            return CommandResult::error(auth.message);
        }

        auto graph = services->graph(*tokens, hostname, site_path);

        std::string url;
        auto resolved = graph->content_url(file_path, url, context_.stop);
        if (!resolved) {
            return CommandResult::error("Cannot locate " + file_path + ": " + resolved.describe());
        }

        LOG_INFO("Fetching {} from {}{} to {}", file_path, hostname, site_path, destination);

        transfer::TransferSpec spec;
        spec.object_id = file_path;
        spec.source_url = url;
        spec.destination = destination;

        return run_transfer(*services, std::move(spec), *graph,
                            std::make_unique<network::HttpChunkSource>(services->http(), url, tokens));

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

CommandResult GetCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& url = args[1];
    const auto& destination = args[2];

    if (!StringUtils::starts_with(StringUtils::to_lower(url), "http://") &&
        !StringUtils::starts_with(StringUtils::to_lower(url), "https://")) {
        return CommandResult::error("Not an http(s) URL: " + url);
    }

    try {
        auto services = Services::from_config();
        network::HeadMetadataSource metadata(services->http());

        transfer::TransferSpec spec;
        spec.object_id = url;
        spec.source_url = url;
        spec.destination = destination;

        return run_transfer(*services, std::move(spec), metadata,
                            std::make_unique<network::HttpChunkSource>(services->http(), url));

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::string folder = args.size() > 3 ? args[3] : "";

    try {
        auto services = Services::from_config();

        network::TokenProvider* tokens = nullptr;
        auto auth = services->tokens(tokens);
        if (!auth) {
            return CommandResult::error(auth.message);
        }

        auto graph = services->graph(*tokens, args[1], args[2]);

        std::vector<network::DriveItem> items;
        auto listed = graph->list(folder, items, context_.stop);
        if (!listed) {
            return CommandResult::error("Cannot list " + (folder.empty() ? std::string("/") : folder) + ": " +
                                        listed.describe());
        }

        if (items.empty()) {
            std::cout << "No items\n";
            return CommandResult::ok();
        }

        for (const auto& item : items) {
            std::cout << (item.is_folder ? "d " : "- ")
                      << std::right << std::setw(12)
                      << (item.is_folder ? std::string("-") : StringUtils::format_bytes(item.size))
                      << "  " << std::left << std::setw(22) << item.last_modified
                      << item.name << (item.is_folder ? "/" : "") << "\n";
        }
        std::cout << items.size() << " items\n";

        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

CommandResult ReadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& file_path = args[3];

    try {
        auto services = Services::from_config();

        network::TokenProvider* tokens = nullptr;
        auto auth = services->tokens(tokens);
        if (!auth) {
            return CommandResult::error(auth.message);
        }

        auto graph = services->graph(*tokens, args[1], args[2]);

        std::string url;
        auto resolved = graph->content_url(file_path, url, context_.stop);
        if (!resolved) {
            return CommandResult::error("Cannot locate " + file_path + ": " + resolved.describe());
        }

        transfer::TransferSpec spec;
        spec.object_id = file_path;
        spec.source_url = url;
        spec.destination = "memory://" + file_path;
        spec.chunk_size = services->options().chunk_size;
        spec.buffer_capacity = services->options().buffer_chunks;
        spec.expected_digest = context_.expected_digest;

        network::HttpChunkSource source(services->http(), url, tokens);
        storage::MemorySink sink(spec.destination);
        transfer::LoggingProgressReporter progress;

        transfer::TransferSession session("read", spec, services->options(), *graph, source, sink, &progress);
        std::stop_callback on_interrupt(context_.stop, [&session] { session.cancel(); });

        auto outcome = session.run();
        if (!outcome.success()) {
            return CommandResult::error(fmt::format("Read {}: {}", transfer::to_string(outcome.state),
                                                    outcome.error.describe()));
        }

        storage::Table::CsvOptions csv;
        csv.delimiter = context_.delimiter;
        csv.has_header = context_.has_header;

        storage::Table table;
        auto parsed = storage::Table::parse_csv(sink.data(), csv, table);
        if (!parsed) {
            return CommandResult::error("Cannot parse " + file_path + ": " + parsed.message);
        }

        std::cout << table.preview(context_.rows);
        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

CommandResult HistoryCommandHandler::execute(const std::vector<std::string>& args) {
    try {
        auto& config = Config::instance();
        auto journal_path = config.get_string("journal.path");
        if (journal_path.empty()) {
            return CommandResult::error("journal.path is not configured");
        }

        storage::TransferJournal journal(utils::FileUtils::expand_user(journal_path));
        if (!journal.initialize()) {
            return CommandResult::error("Failed to open transfer history at " + journal_path);
        }

        auto entries = journal.recent(context_.rows);
        if (entries.empty()) {
            std::cout << "No transfers recorded\n";
            return CommandResult::ok();
        }

        for (const auto& entry : entries) {
            std::cout << TimeUtils::to_iso_string(entry.finished_at) << "  "
                      << std::left << std::setw(10) << transfer::to_string(entry.state)
                      << std::right << std::setw(12) << StringUtils::format_bytes(entry.bytes_transferred)
                      << "  " << entry.object_id << " -> " << entry.destination << "\n";
            if (!entry.error_message.empty()) {
                std::cout << "    " << entry.error_kind << ": " << entry.error_message;
                if (entry.attempts > 0) {
                    std::cout << " (after " << entry.attempts << " attempts)";
                }
                std::cout << "\n";
            }
        }
        std::cout << "Showing " << entries.size() << " of " << journal.count() << " transfers\n";

        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

}
