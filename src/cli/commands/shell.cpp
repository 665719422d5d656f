#include "../base_cli.hpp"
#include "../theme.hpp"
#include "../shell_escape.hpp"
#include <platform/terminal.hpp>

static void do_send(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto sent = cli.session->send(arg + "\n");
    if (sent.is_err()) {
        cli.print(theme::fail(sent.error));
    }
}

// Raw passthrough: keystrokes go to the remote shell, output keeps arriving
// through the chunk feed. "~." at the start of a line returns to the prompt.
static void do_shell(BaseCLI& cli, const std::string&) {
    if (!cli.require_connection()) return;
    cli.print(theme::info("Interactive shell. Type ~. at the start of a line to return."));

    {
        platform::RawModeGuard raw(platform::RawModeGuard::kFullRaw);
        ShellEscape escape;
        char buf[1024];

        while (!escape.leave() && cli.session->state().is(SessionPhase::Connected)) {
            if (!platform::poll_stdin(100)) continue;
            int n = platform::read_stdin(buf, sizeof(buf));
            if (n <= 0) break;

            std::string out = escape.filter(buf, n);
            if (!out.empty()) {
                auto sent = cli.session->send(out);
                if (sent.is_err()) break;
            }
        }
    }

    platform::flush_stdin();
    cli.print("\r\n");
    if (!cli.session->state().is(SessionPhase::Connected)) {
        cli.print(theme::info("Shell closed."));
    }
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("send", do_send, "Send one line of input to the shell");
    cli.add_command("shell", do_shell, "Attach the terminal to the remote shell");
}
