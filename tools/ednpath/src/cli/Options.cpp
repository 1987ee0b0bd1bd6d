#include <ednpath_tool/cli/Options.hpp>

#include <charconv>
#include <string_view>
#include <vector>

namespace ednpath_tool::cli {

namespace {

bool is_command(std::string_view s) {
    return s == "locate" || s == "check" || s == "tree";
}

Command to_command(std::string_view s) {
    if (s == "locate") return Command::kLocate;
    if (s == "check") return Command::kCheck;
    if (s == "tree") return Command::kTree;
    return Command::kNone;
}

bool has_value_prefix(std::string_view a, std::string_view key) {
    return a == key || (a.size() > key.size() && a.substr(0, key.size()) == key && a[key.size()] == '=');
}

bool parse_opt_value(const std::vector<std::string_view>& args,
                     size_t& i,
                     std::string_view key,
                     std::string& out,
                     std::string& err) {
    const auto a = args[i];
    const auto pref = std::string(key) + "=";
    if (a.rfind(pref, 0) == 0) {
        out = std::string(a.substr(pref.size()));
        if (out.empty()) {
            err = std::string(key) + " requires a value";
            return false;
        }
        return true;
    }

    if (i + 1 >= args.size()) {
        err = std::string(key) + " requires a value";
        return false;
    }
    ++i;
    out = std::string(args[i]);
    if (out.empty()) {
        err = std::string(key) + " requires a value";
        return false;
    }
    return true;
}

bool parse_u32(std::string_view s, uint32_t& out) {
    if (s.empty()) return false;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

bool is_one_of(std::string_view v, std::string_view a, std::string_view b, std::string_view c) {
    return v == a || v == b || v == c;
}

} // namespace

void print_usage(std::ostream& os) {
    os
        << "ednpath [global-options] <command> [args]\n"
        << "\n"
        << "Global options:\n"
        << "  -h, --help\n"
        << "  --version\n"
        << "  --color <auto|always|never>\n"
        << "  --log-level <quiet|info|debug>\n"
        << "\n"
        << "Commands:\n"
        << "  locate <file> <path> [--head <name>] [--format <text|json>]\n"
        << "  check <file> [--at <path>] [--head <name>] [--context <N>] [--table <compiler|build>]\n"
        << "  tree <file>\n"
        << "\n"
        << "Paths are EDN, e.g. '[:cljsbuild :builds 0 :compiler]'.\n";
}

Options parse_options(int argc, char** argv) {
    Options out{};

    if (argc <= 1) {
        out.mode = Mode::kUsage;
        return out;
    }

    std::vector<std::string_view> args{};
    args.reserve(static_cast<size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const auto a = args[i];
        if (a == "-h" || a == "--help") {
            out.mode = Mode::kUsage;
            return out;
        }
        if (a == "--version") {
            out.mode = Mode::kVersion;
            return out;
        }
        if (has_value_prefix(a, "--color")) {
            std::string v;
            if (!parse_opt_value(args, i, "--color", v, out.error)) {
                out.ok = false;
                return out;
            }
            if (!is_one_of(v, "auto", "always", "never")) {
                out.ok = false;
                out.error = "--color must be auto, always or never";
                return out;
            }
            out.color = std::move(v);
            continue;
        }
        if (has_value_prefix(a, "--log-level")) {
            std::string v;
            if (!parse_opt_value(args, i, "--log-level", v, out.error)) {
                out.ok = false;
                return out;
            }
            if (!is_one_of(v, "quiet", "info", "debug")) {
                out.ok = false;
                out.error = "--log-level must be quiet, info or debug";
                return out;
            }
            out.log_level = std::move(v);
            continue;
        }
        if (is_command(a)) {
            out.command = to_command(a);
            out.mode = Mode::kCommand;
            ++i;
            break;
        }

        if (!a.empty() && a[0] == '-') {
            out.ok = false;
            out.error = "unknown global option: " + std::string(a);
            return out;
        }

        out.ok = false;
        out.error = "unknown command: " + std::string(a);
        return out;
    }

    if (out.mode != Mode::kCommand) {
        out.ok = false;
        out.error = "missing command";
        return out;
    }

    const std::string cmd_name = (out.command == Command::kLocate) ? "locate"
                               : (out.command == Command::kCheck)  ? "check"
                                                                   : "tree";
    std::vector<std::string> positionals{};

    for (; i < args.size(); ++i) {
        const auto a = args[i];
        if (a.empty() || a[0] != '-') {
            positionals.emplace_back(a);
            continue;
        }

        if (out.command != Command::kTree && has_value_prefix(a, "--head")) {
            std::string v;
            if (!parse_opt_value(args, i, "--head", v, out.error)) {
                out.ok = false;
                return out;
            }
            out.head = std::move(v);
            continue;
        }
        if (out.command == Command::kLocate && has_value_prefix(a, "--format")) {
            std::string v;
            if (!parse_opt_value(args, i, "--format", v, out.error)) {
                out.ok = false;
                return out;
            }
            if (v == "text") {
                out.locate.format = OutputFormat::kText;
            } else if (v == "json") {
                out.locate.format = OutputFormat::kJson;
            } else {
                out.ok = false;
                out.error = "--format must be text or json";
                return out;
            }
            continue;
        }
        if (out.command == Command::kCheck && has_value_prefix(a, "--at")) {
            std::string v;
            if (!parse_opt_value(args, i, "--at", v, out.error)) {
                out.ok = false;
                return out;
            }
            out.check.at = std::move(v);
            continue;
        }
        if (out.command == Command::kCheck && has_value_prefix(a, "--context")) {
            std::string v;
            if (!parse_opt_value(args, i, "--context", v, out.error)) {
                out.ok = false;
                return out;
            }
            uint32_t n = 0;
            if (!parse_u32(v, n)) {
                out.ok = false;
                out.error = "--context requires a non-negative integer";
                return out;
            }
            out.check.context = n;
            continue;
        }
        if (out.command == Command::kCheck && has_value_prefix(a, "--table")) {
            std::string v;
            if (!parse_opt_value(args, i, "--table", v, out.error)) {
                out.ok = false;
                return out;
            }
            if (v == "compiler") {
                out.check.table = Table::kCompiler;
            } else if (v == "build") {
                out.check.table = Table::kBuild;
            } else {
                out.ok = false;
                out.error = "--table must be compiler or build";
                return out;
            }
            continue;
        }

        out.ok = false;
        out.error = "unknown " + cmd_name + " option: " + std::string(a);
        return out;
    }

    if (positionals.empty()) {
        out.ok = false;
        out.error = cmd_name + " requires a file";
        return out;
    }

    if (out.command == Command::kLocate) {
        if (positionals.size() < 2) {
            out.ok = false;
            out.error = "locate requires a path";
            return out;
        }
        out.locate.file = positionals[0];
        // "locate f :a :b 0" reads the same as "locate f '[:a :b 0]'"
        for (size_t k = 1; k < positionals.size(); ++k) {
            if (k > 1) out.locate.path += ' ';
            out.locate.path += positionals[k];
        }
        return out;
    }

    if (positionals.size() > 1) {
        out.ok = false;
        out.error = cmd_name + " takes exactly one file";
        return out;
    }
    if (out.command == Command::kCheck) {
        out.check.file = positionals[0];
    } else {
        out.tree.file = positionals[0];
    }
    return out;
}

} // namespace ednpath_tool::cli
