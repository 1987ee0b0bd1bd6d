#include <ednpath/config/Config.hpp>

#include <ednpath/config/TomlLite.hpp>

#include <initializer_list>
#include <set>
#include <utility>

namespace ednpath::config {

namespace {

const std::set<std::string>& known_keys_() {
    static const std::set<std::string> keys = {
        "resolve.call_form_head",
        "diag.context",
        "diag.color",
        "log.level",
    };
    return keys;
}

template <typename T>
const T* as_ptr(const Value* v) {
    return std::get_if<T>(v);
}

void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, const std::string& source_name) {
    for (auto it = values.begin(); it != values.end();) {
        if (is_known_key(it->first)) {
            ++it;
            continue;
        }
        warnings.push_back(source_name + ": unknown key '" + it->first + "' ignored");
        it = values.erase(it);
    }
}

bool one_of(std::string_view v, std::initializer_list<std::string_view> allowed) {
    for (const auto a : allowed) {
        if (v == a) return true;
    }
    return false;
}

} // namespace

bool is_known_key(std::string_view key) {
    return known_keys_().contains(std::string(key));
}

std::optional<std::filesystem::path> find_config(std::filesystem::path start) {
    std::error_code ec{};
    if (start.empty()) start = std::filesystem::current_path(ec);
    if (ec) return std::nullopt;

    start = std::filesystem::absolute(start, ec);
    if (ec) return std::nullopt;
    if (!std::filesystem::is_directory(start, ec)) start = start.parent_path();

    for (std::filesystem::path cur = start; !cur.empty(); cur = cur.parent_path()) {
        const auto candidate = cur / kConfigFileName;
        if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
        const auto parent = cur.parent_path();
        if (parent == cur) break;
    }
    return std::nullopt;
}

LoadedConfig load(const std::optional<std::filesystem::path>& anchor) {
    LoadedConfig out{};
    out.path = find_config(anchor.value_or(std::filesystem::path{}));
    if (!out.path) return out;

    std::string err{};
    if (!toml_lite::parse_file(*out.path, out.values, out.warnings, err)) {
        out.warnings.push_back("failed to load settings: " + err);
        out.values.clear();
        return out;
    }
    filter_unknown_keys(out.values, out.warnings, out.path->string());
    return out;
}

EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings) {
    EffectiveSettings s{};
    const FlatMap& v = cfg.values;

    auto warn = [&](std::string msg) {
        if (warnings != nullptr) warnings->push_back(std::move(msg));
    };
    auto get_string = [&](std::string_view key, std::string& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return false;
        if (const auto* p = as_ptr<std::string>(&it->second); p != nullptr) {
            dst = *p;
            return true;
        }
        warn("config key '" + std::string(key) + "' has wrong type (expected string)");
        return false;
    };
    auto get_int = [&](std::string_view key, int64_t& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return false;
        if (const auto* p = as_ptr<int64_t>(&it->second); p != nullptr) {
            dst = *p;
            return true;
        }
        warn("config key '" + std::string(key) + "' has wrong type (expected int)");
        return false;
    };

    std::string head{};
    if (get_string("resolve.call_form_head", head)) {
        if (head.empty()) {
            warn("config key 'resolve.call_form_head' must not be empty");
        } else {
            s.resolve_call_form_head = head;
        }
    }

    int64_t context = 0;
    if (get_int("diag.context", context)) {
        if (context < 0) {
            warn("config key 'diag.context' must be >= 0");
        } else {
            s.diag_context = context;
        }
    }

    std::string color{};
    if (get_string("diag.color", color)) {
        if (!one_of(color, {"auto", "always", "never"})) {
            warn("config key 'diag.color' must be auto, always or never");
        } else {
            s.diag_color = color;
        }
    }

    std::string level{};
    if (get_string("log.level", level)) {
        if (!one_of(level, {"quiet", "info", "debug"})) {
            warn("config key 'log.level' must be quiet, info or debug");
        } else {
            s.log_level = level;
        }
    }

    return s;
}

std::string render_value_text(const Value& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    return {};
}

} // namespace ednpath::config
