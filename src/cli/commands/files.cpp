#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>
#include <util/remote_path.hpp>
#include <util/string_utils.hpp>

// Whitespace-separated arguments; "double quoted" ones may contain spaces.
static std::vector<std::string> split_args(const std::string& arg) {
    std::vector<std::string> out;
    std::istringstream iss(arg);
    std::string tok;
    while (iss >> std::quoted(tok)) out.push_back(tok);
    return out;
}

static bool want_args(const std::vector<std::string>& args, size_t min, const std::string& usage) {
    if (args.size() < min) {
        std::cout << "Usage: " << usage << "\n";
        return false;
    }
    return true;
}

static std::string format_mtime(int64_t mtime) {
    std::time_t t = static_cast<std::time_t>(mtime);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return buf;
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    std::string path = args.empty() ? "/" : args[0];

    auto r = cli.gateway->list_directory(path);
    if (!cli.report(r)) return;

    std::cout << theme::dim("    " + RemotePath::normalize(path)) << "\n";
    for (const auto& e : r.value) {
        std::string name = e.is_dir() ? theme::blue(e.name + "/") : e.name;
        if (e.kind == FileKind::Symlink) name = theme::yellow(e.name + "@");
        std::cout << fmt::format("    {:o}  {:>10}  {}  {}\n",
                                 e.permissions,
                                 e.is_dir() ? "-" : StringUtils::format_size(e.size),
                                 theme::dim(format_mtime(e.mtime)), name);
    }
    if (r.value.empty()) std::cout << theme::dim("    (empty)") << "\n";
}

static void do_stat(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "stat <path>")) return;

    auto r = cli.gateway->stat(args[0]);
    if (!cli.report(r)) return;
    const auto& e = r.value;
    std::cout << theme::kv("Path", e.path);
    std::cout << theme::kv("Kind", file_kind_name(e.kind));
    std::cout << theme::kv("Size", fmt::format("{} ({} bytes)", StringUtils::format_size(e.size), e.size));
    std::cout << theme::kv("Modified", format_mtime(e.mtime));
    std::cout << theme::kv("Mode", fmt::format("{:04o}", e.permissions));
}

static void do_cat(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "cat <path>")) return;

    auto r = cli.gateway->read_file(args[0]);
    if (!cli.report(r)) return;
    std::cout << r.value;
    if (!r.value.empty() && r.value.back() != '\n') std::cout << "\n";
}

// Content is read from the terminal up to a line holding a single "."
static void do_write(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "write <path>")) return;

    std::cout << theme::dim("    Enter content; finish with a line containing only '.'") << "\n";
    std::string content, line;
    while (std::getline(std::cin, line)) {
        if (line == ".") break;
        content += line + "\n";
    }

    if (!cli.report(cli.gateway->write_file(args[0], content))) return;
    std::cout << theme::ok(fmt::format("Saved {} ({})", RemotePath::normalize(args[0]),
                                       StringUtils::format_size(content.size())));
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "put <local-file> [remote-path]")) return;

    std::filesystem::path local = args[0];
    auto in = std::make_shared<std::ifstream>(local, std::ios::binary);
    if (!*in) {
        std::cout << theme::fail("Cannot read " + local.string());
        return;
    }
    std::string remote = args.size() > 1 ? args[1] : "/" + local.filename().string();

    std::cout << theme::step("Uploading " + local.string() + " -> " + RemotePath::normalize(remote));
    auto task = cli.gateway->start_upload(in, remote);
    auto r = task->wait();
    if (!cli.report(r)) return;
    std::cout << theme::ok("Uploaded " + StringUtils::format_size(r.value.bytes));
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "get <remote-file> [local-path]")) return;

    std::string remote = RemotePath::normalize(args[0]);
    std::filesystem::path local = args.size() > 1 ? args[1] : RemotePath::basename(remote);
    if (local.empty()) {
        std::cout << theme::fail("Give a local path for " + remote);
        return;
    }

    auto out = std::make_shared<std::ofstream>(local, std::ios::binary | std::ios::trunc);
    if (!*out) {
        std::cout << theme::fail("Cannot write " + local.string());
        return;
    }

    auto task = cli.gateway->start_download(remote, [out](const char* data, size_t len) {
        out->write(data, static_cast<std::streamsize>(len));
        return static_cast<bool>(*out);
    });
    auto r = task->wait();
    out->close();
    if (!cli.report(r)) {
        std::error_code ec;
        std::filesystem::remove(local, ec);
        return;
    }
    std::cout << theme::ok(fmt::format("Saved {} ({})", local.string(),
                                       StringUtils::format_size(r.value.bytes)));
}

static void do_zip(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "zip <remote-dir> [local.zip]")) return;

    std::string remote = RemotePath::normalize(args[0]);
    std::string base = RemotePath::basename(remote);
    std::filesystem::path local = args.size() > 1 ? args[1] : (base.empty() ? "root" : base) + ".zip";

    auto out = std::make_shared<std::ofstream>(local, std::ios::binary | std::ios::trunc);
    if (!*out) {
        std::cout << theme::fail("Cannot write " + local.string());
        return;
    }

    std::cout << theme::step("Archiving " + remote);
    auto task = cli.gateway->start_archive(remote, [out](const char* data, size_t len) {
        out->write(data, static_cast<std::streamsize>(len));
        return static_cast<bool>(*out);
    });
    auto r = task->wait();
    out->close();
    if (!cli.report(r)) {
        std::error_code ec;
        std::filesystem::remove(local, ec);
        return;
    }

    for (const auto& w : r.value.warnings) std::cout << theme::info(w);
    std::cout << theme::ok(fmt::format("{} entries, {} -> {}", r.value.entries,
                                       StringUtils::format_size(r.value.bytes), local.string()));
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "mkdir <path>")) return;
    if (cli.report(cli.gateway->create_directory(args[0]))) {
        std::cout << theme::ok("Created " + RemotePath::normalize(args[0]) + "/");
    }
}

static void do_touch(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "touch <path>")) return;
    if (cli.report(cli.gateway->create_file(args[0]))) {
        std::cout << theme::ok("Created " + RemotePath::normalize(args[0]));
    }
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 1, "rm <path>")) return;
    if (cli.report(cli.gateway->remove(args[0]))) {
        std::cout << theme::ok("Deleted " + RemotePath::normalize(args[0]));
    }
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (!want_args(args, 2, "mv <from> <to>")) return;
    if (cli.report(cli.gateway->rename(args[0], args[1]))) {
        std::cout << theme::ok(RemotePath::normalize(args[0]) + " -> " + RemotePath::normalize(args[1]));
    }
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "List a remote directory (default /)");
    cli.add_command("stat", do_stat, "Show one entry's metadata");
    cli.add_command("cat", do_cat, "Print a remote file");
    cli.add_command("write", do_write, "Replace a remote file with typed content");
    cli.add_command("put", do_put, "Upload a local file");
    cli.add_command("get", do_get, "Download a remote file");
    cli.add_command("zip", do_zip, "Download a remote directory as a zip");
    cli.add_command("mkdir", do_mkdir, "Create a remote directory");
    cli.add_command("touch", do_touch, "Create an empty remote file");
    cli.add_command("rm", do_rm, "Delete a file or directory tree");
    cli.add_command("mv", do_mv, "Rename or move an entry");
}
