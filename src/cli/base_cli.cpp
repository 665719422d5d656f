#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <ssh/libssh2_client.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
    set_tether_log_path(config.log_path().string());

    client = std::make_unique<Libssh2Client>(config.shell(), config.transfer());
    store = std::make_unique<SessionStore>(config.sessions_path());

    SessionCallbacks callbacks;
    callbacks.on_state = [this](const SessionState& state) {
        switch (state.phase) {
        case SessionPhase::Connected:
            print(theme::ok("Connected to " + state.reason));
            break;
        case SessionPhase::Failed:
            print(theme::fail(describe(state)));
            break;
        case SessionPhase::Disconnected:
            if (!state.reason.empty()) print(theme::info("Disconnected: " + state.reason));
            break;
        default:
            print(theme::log(describe(state)));
            break;
        }
    };
    callbacks.on_transfer = [this](const TransferEvent& ev) {
        std::string what = fmt::format("#{} {} {}", ev.job.id, to_string(ev.job.direction),
                                       ev.job.direction == TransferDirection::Upload
                                           ? ev.job.local_path.string()
                                           : ev.job.remote_path);
        if (ev.status == TransferStatus::Succeeded) {
            print(theme::ok(what + " done"));
        } else {
            print(theme::fail(fmt::format("{} failed ({}): {}", what,
                                          ev.error ? to_string(*ev.error) : "?", ev.message)));
        }
        std::lock_guard<std::mutex> lock(out_mutex_);
        progress_marks_.erase(ev.job.id);
    };
    callbacks.on_progress = [this](const TransferProgress& p) {
        if (p.bytes_total == 0) return;
        int decile = static_cast<int>(p.bytes_done * 10 / p.bytes_total);
        {
            std::lock_guard<std::mutex> lock(out_mutex_);
            int& mark = progress_marks_[p.job_id];
            if (decile <= mark) return;
            mark = decile;
        }
        print(theme::log(fmt::format("#{} {}%", p.job_id, decile * 10)));
    };

    session = std::make_unique<SessionManager>(*client, *store, config.shell(),
                                               std::move(callbacks));

    feed = std::make_unique<ChunkFeed>(session->output(), [this](const OutputChunk& chunk) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        platform::write_stdout(chunk.text);
    }, config.shell().poll_interval());
    feed->start();
}

BaseCLI::~BaseCLI() {
    // The feed reads the session's queue; stop it while both exist.
    if (feed) feed->stop();
    feed.reset();
    session.reset();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_connection() {
    if (!session || !session->state().is(SessionPhase::Connected)) {
        print(theme::fail("Not connected."));
        print(theme::step("Use 'open user@host' or 'connect <saved session>' first."));
        return false;
    }
    return true;
}

void BaseCLI::print(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    std::cout << text << std::flush;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        print(theme::fail("Unknown command: " + command));
        print(theme::step("Type 'help' for available commands."));
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        print(theme::fail(std::string(e.what())));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connection", {"open", "connect", "disconnect", "status"}},
        {"Shell",      {"send", "shell"}},
        {"Transfer",   {"upload", "download"}},
        {"Sessions",   {"sessions", "history", "save", "delete"}},
        {"General",    {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::brown(theme::bold("  " + cat_name)) << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::blue(fmt::format("    {:<14}", name))
                          << theme::dim(it->second.second) << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "tether" + rl_esc(theme::color::RESET);
    if (session && session->state().is(SessionPhase::Connected)) {
        auto req = session->last_request();
        if (req) {
            prompt += ":" + rl_esc(theme::color::BLUE) + req->username
                    + rl_esc(theme::color::RESET) + "@"
                    + rl_esc(theme::color::GREEN) + req->host
                    + rl_esc(theme::color::RESET);
        }
    }
    return prompt + "> ";
}
