#include "../base_cli.hpp"
#include "../theme.hpp"
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/utils.hpp>

static bool two_paths(BaseCLI& cli, const std::string& arg, const char* usage,
                      std::string& first, std::string& second) {
    auto args = split_args(arg);
    if (args.size() != 2) {
        cli.print(theme::fail(std::string("Usage: ") + usage));
        return false;
    }
    first = args[0];
    second = args[1];
    return true;
}

static void do_upload(BaseCLI& cli, const std::string& arg) {
    std::string local, remote;
    if (!two_paths(cli, arg, "upload <local> <remote>", local, remote)) return;
    if (!cli.require_connection()) return;

    auto job = cli.session->upload(expand_home(local), remote);
    cli.print(theme::step(fmt::format("#{} upload {} -> {}", job.id, job.local_path.string(),
                                      job.remote_path)));
}

static void do_download(BaseCLI& cli, const std::string& arg) {
    std::string remote, local;
    if (!two_paths(cli, arg, "download <remote> <local>", remote, local)) return;
    if (!cli.require_connection()) return;

    auto job = cli.session->download(remote, expand_home(local));
    cli.print(theme::step(fmt::format("#{} download {} -> {}", job.id, job.remote_path,
                                      job.local_path.string())));
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("upload", do_upload, "Copy a local file to the remote host");
    cli.add_command("download", do_download, "Copy a remote file to this machine");
}
