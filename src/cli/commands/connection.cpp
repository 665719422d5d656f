#include "../base_cli.hpp"
#include "../tether_cli.hpp"
#include "../theme.hpp"
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/credential_resolver.hpp>
#include <core/utils.hpp>

static void start_connect(BaseCLI& cli, const ConnectionRequest& request,
                          const std::string& saved_name) {
    cli.print(theme::step("Connecting to " + request.target() + "..."));
    cli.session->connect_async(request, saved_name, [&cli](const ConnectOutcome& result) {
        // Failed/Connected transitions print through the state callback;
        // a rejected attempt never changes state.
        if (result.is_err() && (result.kind == ConnectErrorKind::AlreadyActive ||
                                result.kind == ConnectErrorKind::Cancelled)) {
            cli.print(theme::fail(result.error));
        }
    });
}

static void print_validation_error(BaseCLI& cli, const ResolveResult& r) {
    cli.print(theme::fail(fmt::format("{}: {}", to_string(r.kind), r.error)));
}

// open user@host[:port] [-p port] [-i key_file] [-t timeout] [--no-keepalive]
static void do_open(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.empty()) {
        cli.print(theme::fail("Usage: open user@host[:port] [-p port] [-i key] [-t secs] [--no-keepalive]"));
        return;
    }

    const auto& defaults = cli.config.defaults();
    RawConnectionFields fields;
    fields.port = std::to_string(defaults.port);
    fields.timeout = std::to_string(defaults.timeout);
    fields.keepalive = defaults.keepalive;

    std::string target = args[0];
    auto at = target.rfind('@');
    if (at != std::string::npos) {
        fields.username = target.substr(0, at);
        target = target.substr(at + 1);
    }
    auto colon = target.rfind(':');
    if (colon != std::string::npos) {
        fields.port = target.substr(colon + 1);
        target = target.substr(0, colon);
    }
    fields.host = target;

    for (size_t i = 1; i < args.size(); i++) {
        const std::string& flag = args[i];
        bool has_value = i + 1 < args.size();
        if (flag == "-p" && has_value) {
            fields.port = args[++i];
        } else if (flag == "-i" && has_value) {
            fields.key_file = expand_home(args[++i]).string();
        } else if (flag == "-t" && has_value) {
            fields.timeout = args[++i];
        } else if (flag == "-l" && has_value) {
            fields.username = args[++i];
        } else if (flag == "--no-keepalive") {
            fields.keepalive = false;
        } else {
            cli.print(theme::fail("Unknown option: " + flag));
            return;
        }
    }

    // Catch form errors before asking for a password
    if (fields.key_file.empty()) {
        RawConnectionFields probe = fields;
        probe.password = "-";
        auto checked = CredentialResolver::resolve(probe);
        if (checked.is_err()) {
            print_validation_error(cli, checked);
            return;
        }
        fields.password = read_password(theme::brown("    Password: "));
    }

    auto resolved = CredentialResolver::resolve(fields);
    if (resolved.is_err()) {
        print_validation_error(cli, resolved);
        return;
    }
    start_connect(cli, resolved.value, "");
}

// connect <saved session>
static void do_connect(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) {
        cli.print(theme::fail("Usage: connect <saved session>"));
        return;
    }
    auto saved = cli.store->get(name);
    if (!saved) {
        cli.print(theme::fail("No saved session named '" + name + "'"));
        cli.print(theme::step("Type 'sessions' to list saved sessions."));
        return;
    }

    std::string password;
    if (saved->key_file.empty()) {
        password = read_password(theme::brown(
            fmt::format("    Password for {}@{}: ", saved->username, saved->host)));
    }
    auto resolved = cli.session->request_from_saved(name, password);
    if (resolved.is_err()) {
        print_validation_error(cli, resolved);
        return;
    }
    start_connect(cli, resolved.value, name);
}

static void do_disconnect(BaseCLI& cli, const std::string&) {
    SessionPhase phase = cli.session->state().phase;
    if (phase != SessionPhase::Connected && phase != SessionPhase::Connecting) {
        cli.print(theme::fail("Not connected."));
        return;
    }
    cli.session->disconnect();
}

static void do_status(BaseCLI& cli, const std::string&) {
    std::string out = theme::section("Status");

    SessionState state = cli.session->state();
    out += theme::kv("Session", describe(state));
    auto req = cli.session->last_request();
    if (req && state.is(SessionPhase::Connected)) {
        out += theme::kv("Target", req->target());
        out += theme::kv("Auth", req->auth.method == AuthMethod::PrivateKey
                                     ? "key " + req->auth.secret : std::string("password"));
        out += theme::kv("Keepalive", req->keepalive_enabled ? "on" : "off");
    }
    out += theme::kv("Transfers", fmt::format("{} running", cli.session->active_transfers()));
    out += theme::kv("Config", config_exists() ? get_config_path().string() : "defaults");
    out += theme::kv("Sessions", cli.store->path().string());
    out += "\n";
    cli.print(out);
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("open", do_open, "Connect to user@host[:port]");
    cli.add_command("connect", do_connect, "Connect to a saved session");
    cli.add_command("disconnect", do_disconnect, "Close the current session");
    cli.add_command("status", do_status, "Show session and transfer status");
}
