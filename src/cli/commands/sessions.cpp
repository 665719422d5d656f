#include "../base_cli.hpp"
#include "../theme.hpp"
#include <fmt/format.h>
#include <core/utils.hpp>

static std::string session_row(const SavedSession& s) {
    std::string auth = s.key_file.empty() ? "password" : "key " + s.key_file;
    return theme::blue(fmt::format("    {:<16}", s.name))
         + fmt::format("{}@{}:{}", s.username, s.host, s.port)
         + theme::dim("  " + auth + (s.last_connected ? "  last " + *s.last_connected : std::string()))
         + "\n";
}

static void do_sessions(BaseCLI& cli, const std::string&) {
    auto all = cli.store->list();
    if (all.empty()) {
        cli.print(theme::info("No saved sessions. Connect, then 'save <name>'."));
        return;
    }
    std::string out = theme::section("Saved sessions");
    for (const auto& s : all) out += session_row(s);
    cli.print(out + "\n");
}

static void do_history(BaseCLI& cli, const std::string&) {
    auto recent = cli.store->history();
    if (recent.empty()) {
        cli.print(theme::info("No connection history yet."));
        return;
    }
    std::string out = theme::section("History");
    for (const auto& s : recent) out += session_row(s);
    cli.print(out + "\n");
}

// save <name>: the current connection's parameters, never its password
static void do_save(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) {
        cli.print(theme::fail("Usage: save <name>"));
        return;
    }
    auto req = cli.session->last_request();
    if (!req) {
        cli.print(theme::fail("Nothing to save: connect first."));
        return;
    }

    SavedSession s;
    s.name = name;
    s.host = req->host;
    s.port = req->port;
    s.username = req->username;
    if (req->auth.method == AuthMethod::PrivateKey) s.key_file = req->auth.secret;
    s.timeout = static_cast<int>(req->timeout.count());
    s.keepalive = req->keepalive_enabled;
    if (auto existing = cli.store->get(name)) s.last_connected = existing->last_connected;

    auto stored = cli.store->put(s);
    if (stored.is_err()) {
        cli.print(theme::fail(stored.error));
        return;
    }
    cli.print(theme::ok("Saved '" + name + "'"));
}

static void do_delete(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) {
        cli.print(theme::fail("Usage: delete <name>"));
        return;
    }
    auto removed = cli.store->remove(name);
    if (removed.is_err()) {
        cli.print(theme::fail(removed.error));
        return;
    }
    cli.print(theme::ok("Deleted '" + name + "'"));
}

void register_sessions_commands(BaseCLI& cli) {
    cli.add_command("sessions", do_sessions, "List saved sessions");
    cli.add_command("history", do_history, "Recently connected sessions");
    cli.add_command("save", do_save, "Save the current connection under a name");
    cli.add_command("delete", do_delete, "Delete a saved session");
}
