#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <functional>
#include <core/config.hpp>
#include <ssh/ssh_client.hpp>
#include <managers/chunk_feed.hpp>
#include <managers/session_manager.hpp>
#include <managers/session_store.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_connection();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Serialized stdout for the REPL and the background callbacks.
    void print(const std::string& text);

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

    // Public state
    Config config;
    std::string config_error;           // set when config.yaml was unreadable
    std::unique_ptr<SshClient> client;
    std::unique_ptr<SessionStore> store;
    std::unique_ptr<SessionManager> session;
    std::unique_ptr<ChunkFeed> feed;
    bool quit_requested = false;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::mutex out_mutex_;
    std::map<uint64_t, int> progress_marks_;   // job id -> last reported decile
};
