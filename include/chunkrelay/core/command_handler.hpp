#pragma once

#include "../network/curl_http_client.hpp"
#include "../network/graph_metadata_source.hpp"
#include "../network/token_provider.hpp"
#include "../storage/sink_factory.hpp"
#include "../storage/transfer_journal.hpp"
#include "../transfer/transfer_session.hpp"
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace chunkrelay::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

// Command line settings that are not configuration keys.
struct CommandContext {
    bool quiet = false;
    std::optional<std::string> expected_digest;
    char delimiter = ',';
    bool has_header = true;
    size_t rows = 20;

    // Requested on Ctrl+C.
    std::stop_token stop;
};

// What the commands talk to, built from configuration.
class Services {
public:
    // Throws std::runtime_error on inconsistent configuration.
    static std::unique_ptr<Services> from_config();

    network::HttpClient& http() { return *http_; }
    storage::SinkFactory& sinks() { return *sinks_; }
    const transfer::TransferOptions& options() const { return options_; }

    // Null when history is unavailable.
    storage::TransferJournal* journal() { return journal_.get(); }

    // Fails when no credentials are configured.
    transfer::TransferResult tokens(network::TokenProvider*& provider);

    std::unique_ptr<network::GraphMetadataSource> graph(network::TokenProvider& tokens,
                                                        const std::string& hostname,
                                                        const std::string& site_path);

private:
    std::unique_ptr<network::CurlHttpClient> http_;
    std::unique_ptr<network::TokenProvider> tokens_;
    std::unique_ptr<storage::SinkFactory> sinks_;
    std::unique_ptr<storage::TransferJournal> journal_;
    transfer::TransferOptions options_;
    std::string graph_base_url_;
};

class CommandHandler {
public:
    explicit CommandHandler(const CommandContext& context) : context_(context) {}
    virtual ~CommandHandler() = default;

    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    const CommandContext& context_;

    // Runs one transfer through a TransferManager with progress meters and
    // prints its outcome.
    CommandResult run_transfer(Services& services,
                               transfer::TransferSpec spec,
                               transfer::MetadataSource& metadata,
                               std::unique_ptr<transfer::ChunkSource> source);
};

class FetchCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Copy a SharePoint file to a destination"; }
    std::string get_usage() const override {
        return "chunkrelay fetch <site-host> <site-path> <file-path> <destination>";
    }
};

class GetCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Copy a pre-authenticated URL to a destination"; }
    std::string get_usage() const override { return "chunkrelay get <url> <destination>"; }
};

class ListCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List the items of a SharePoint folder"; }
    std::string get_usage() const override { return "chunkrelay ls <site-host> <site-path> [folder]"; }
};

class ReadCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Load a delimited SharePoint file into a table"; }
    std::string get_usage() const override {
        return "chunkrelay read <site-host> <site-path> <file-path> [--delimiter c] [--no-header]";
    }
};

class HistoryCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show recent transfers"; }
    std::string get_usage() const override { return "chunkrelay history [-n rows]"; }
};

}
