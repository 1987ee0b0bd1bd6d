#include <ednpath_tool/driver/Driver.hpp>

#include "../dump/Dump.hpp"

#include <ednpath/config/Config.hpp>
#include <ednpath/cst/Cursor.hpp>
#include <ednpath/diag/Render.hpp>
#include <ednpath/log/Log.hpp>
#include <ednpath/nav/Location.hpp>
#include <ednpath/nav/Path.hpp>
#include <ednpath/nav/Resolve.hpp>
#include <ednpath/os/File.hpp>
#include <ednpath/parse/Parser.hpp>
#include <ednpath/schema/Check.hpp>
#include <ednpath/schema/KeyTable.hpp>
#include <ednpath/text/SourceManager.hpp>
#include <ednpath/value/Decode.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ednpath_tool::driver {

namespace {

namespace config = ednpath::config;
namespace diag = ednpath::diag;
namespace log = ednpath::log;
namespace nav = ednpath::nav;

struct RuntimeConfig {
    config::LoadedConfig loaded{};
    config::EffectiveSettings settings{};
};

std::string_view input_file(const cli::Options& opt) {
    switch (opt.command) {
        case cli::Command::kLocate: return opt.locate.file;
        case cli::Command::kCheck: return opt.check.file;
        case cli::Command::kTree: return opt.tree.file;
        case cli::Command::kNone: break;
    }
    return {};
}

RuntimeConfig load_runtime_config(const cli::Options& opt) {
    RuntimeConfig out{};
    out.loaded = config::load(std::filesystem::path(input_file(opt)));
    out.settings = config::materialize(out.loaded, &out.loaded.warnings);

    if (opt.head.has_value()) out.settings.resolve_call_form_head = *opt.head;
    if (opt.color.has_value()) out.settings.diag_color = *opt.color;
    if (opt.log_level.has_value()) out.settings.log_level = *opt.log_level;
    return out;
}

void apply_log_settings(const config::EffectiveSettings& s) {
    log::set_level(log::parse_level(s.log_level).value_or(log::Level::kInfo));
    log::set_color(log::parse_color(s.diag_color).value_or(log::ColorMode::kAuto));
}

nav::ResolveOptions resolve_options(const config::EffectiveSettings& s) {
    nav::ResolveOptions ro{};
    ro.call_form_head = s.resolve_call_form_head;
    return ro;
}

void append_json_escaped(std::ostringstream& oss, std::string_view s) {
    for (const char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
}

std::string render_location_json(const nav::Location& loc) {
    std::ostringstream oss;
    oss << "{\"file\": \"";
    append_json_escaped(oss, loc.file);
    oss << "\", \"line\": " << loc.line
        << ", \"column\": " << loc.column
        << ", \"path\": \"";
    append_json_escaped(oss, nav::to_string(loc.path));
    oss << "\", \"value\": ";
    if (loc.value.has_value()) {
        oss << "\"";
        append_json_escaped(oss, ednpath::value::to_edn(*loc.value));
        oss << "\"";
    } else {
        oss << "null";
    }
    oss << ", \"value_source\": \"" << nav::value_source_name(loc.value_source) << "\"}";
    return oss.str();
}

std::string render_location_text(const nav::Location& loc) {
    std::ostringstream oss;
    oss << loc.file << ":" << loc.line << ":" << loc.column;
    if (loc.value.has_value()) oss << "\t" << ednpath::value::to_edn(*loc.value);
    return oss.str();
}

std::optional<nav::Path> read_path(std::string_view text) {
    diag::Bag bag{};
    auto path = nav::parse_path(text, bag);
    if (!path) {
        std::cerr << bag.render_text();
        return std::nullopt;
    }
    return path;
}

// Reads and parses `file`. On failure reports and returns nullptr; reader
// diagnostics are rendered with a code frame.
ednpath::cst::NodePtr load_document(std::string_view file,
                                    const config::EffectiveSettings& s,
                                    ednpath::text::SourceManager& sm) {
    const auto rd = ednpath::os::read_text_file(file);
    if (!rd.ok) {
        log::fail(std::string(file) + ": " + rd.err);
        return nullptr;
    }
    sm.add(std::string(file), rd.text);

    diag::Bag bag{};
    auto root = ednpath::parse::parse_source(rd.text, file, bag);
    if (bag.has_error()) {
        std::cerr << diag::render_with_source(bag, sm, static_cast<uint32_t>(s.diag_context));
        log::fail(std::string(file) + ": " + std::to_string(bag.size()) + " reader error(s)");
        return nullptr;
    }
    return root;
}

int run_locate(const cli::Options& opt, const config::EffectiveSettings& s) {
    const auto path = read_path(opt.locate.path);
    if (!path) return kExitUsage;

    diag::Bag why{};
    std::optional<nav::Location> loc{};
    try {
        loc = nav::locate_file(*path, opt.locate.file, resolve_options(s), &why);
    } catch (const nav::ContractViolation& e) {
        log::fail(e.what());
        return kExitUsage;
    }

    if (!loc) {
        std::cerr << why.render_text();
        log::fail("could not locate " + nav::to_string(*path) + " in " + opt.locate.file);
        return kExitFailure;
    }

    if (opt.locate.format == cli::OutputFormat::kJson) {
        std::cout << render_location_json(*loc) << "\n";
    } else {
        std::cout << render_location_text(*loc) << "\n";
    }
    log::debug("value source: " + std::string(nav::value_source_name(loc->value_source)));
    return kExitOk;
}

int run_check(const cli::Options& opt, const config::EffectiveSettings& s) {
    const std::string& file = opt.check.file;
    const auto ro = resolve_options(s);

    nav::Path base{};
    if (opt.check.at.has_value()) {
        auto p = read_path(*opt.check.at);
        if (!p) return kExitUsage;
        base = std::move(*p);
    }

    ednpath::text::SourceManager sm{};
    const auto root = load_document(file, s, sm);
    if (!root) return kExitFailure;

    const ednpath::cst::Cursor top(root);
    auto at = nav::initial_position(top, ro);
    if (!at) {
        log::fail(file + ": no '" + ro.call_form_head + "' form or collection to check");
        return kExitFailure;
    }
    if (!base.empty()) {
        try {
            at = nav::get_value_at_path(base, *at, ro);
        } catch (const nav::ContractViolation& e) {
            log::fail(e.what());
            return kExitUsage;
        }
        if (!at) {
            log::fail("could not locate " + nav::to_string(base) + " in " + file);
            return kExitFailure;
        }
    }

    const auto value = ednpath::value::decode(at->node());
    if (!value) {
        log::fail(file + ": the form at " + nav::to_string(base) + " is not plain EDN data");
        return kExitFailure;
    }

    const auto table = (opt.check.table == cli::Table::kBuild)
        ? ednpath::schema::cljs_build_options()
        : ednpath::schema::cljs_compiler_options();
    log::info("checking " + file + " " + nav::to_string(base) + " against " + std::string(table->name()));

    const auto violations = ednpath::schema::check_strict_map(*value, *table, base);
    if (violations.empty()) {
        log::done(file + ": no problems found");
        return kExitOk;
    }

    diag::Bag bag{};
    ednpath::schema::report(violations, root, file, bag, ro);
    const uint32_t context = opt.check.context.value_or(static_cast<uint32_t>(s.diag_context));
    std::cerr << diag::render_with_source(bag, sm, context);
    log::fail(file + ": " + std::to_string(violations.size()) + " problem(s)");
    return kExitFailure;
}

int run_tree(const cli::Options& opt, const config::EffectiveSettings& s) {
    ednpath::text::SourceManager sm{};
    const auto rd = ednpath::os::read_text_file(opt.tree.file);
    if (!rd.ok) {
        log::fail(opt.tree.file + ": " + rd.err);
        return kExitFailure;
    }
    sm.add(opt.tree.file, rd.text);

    diag::Bag bag{};
    const auto root = ednpath::parse::parse_source(rd.text, opt.tree.file, bag);
    // malformed input still has a tree worth showing
    dump::dump_tree(*root, std::cout);

    if (bag.has_error()) {
        std::cerr << diag::render_with_source(bag, sm, static_cast<uint32_t>(s.diag_context));
        return kExitFailure;
    }
    return kExitOk;
}

} // namespace

int run(const cli::Options& opt) {
    const auto runtime = load_runtime_config(opt);
    apply_log_settings(runtime.settings);
    for (const auto& w : runtime.loaded.warnings) log::warn(w);
    if (runtime.loaded.path.has_value()) {
        log::debug("settings from " + runtime.loaded.path->string());
        for (const auto& [k, v] : runtime.loaded.values) {
            log::debug("  " + k + " = " + config::render_value_text(v));
        }
    }

    switch (opt.command) {
        case cli::Command::kLocate:
            return run_locate(opt, runtime.settings);
        case cli::Command::kCheck:
            return run_check(opt, runtime.settings);
        case cli::Command::kTree:
            return run_tree(opt, runtime.settings);
        case cli::Command::kNone:
            break;
    }
    return kExitUsage;
}

} // namespace ednpath_tool::driver
