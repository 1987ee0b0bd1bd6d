#include <ednpath/schema/KeyTable.hpp>

#include <utility>

namespace ednpath::schema {

namespace rules {

Rule any() {
    return Rule{[](const value::Value&) { return true; }, "any value"};
}

Rule string() {
    return Rule{[](const value::Value& v) { return v.is_string(); }, "a string"};
}

Rule boolean() {
    return Rule{[](const value::Value& v) { return v.is_bool(); }, "true or false"};
}

Rule integer() {
    return Rule{[](const value::Value& v) { return v.is_int(); }, "an integer"};
}

Rule number() {
    return Rule{[](const value::Value& v) { return v.is_number(); }, "a number"};
}

Rule symbol() {
    return Rule{[](const value::Value& v) { return v.is_symbol(); }, "a symbol"};
}

Rule keyword() {
    return Rule{[](const value::Value& v) { return v.is_keyword(); }, "a keyword"};
}

Rule map() {
    return Rule{[](const value::Value& v) { return v.is_map(); }, "a map"};
}

Rule string_or_symbol() {
    return Rule{[](const value::Value& v) { return v.is_string() || v.is_symbol(); },
                "a string or symbol"};
}

Rule string_or_named() {
    return Rule{[](const value::Value& v) { return v.is_string() || v.is_symbol() || v.is_keyword(); },
                "a string, symbol or keyword"};
}

Rule one_of(std::vector<std::string> keyword_names) {
    std::string expect = "one of";
    for (const auto& k : keyword_names) expect += " :" + k;

    return Rule{[names = std::move(keyword_names)](const value::Value& v) {
                    const auto* kw = v.as_keyword();
                    if (!kw) return false;
                    for (const auto& n : names) {
                        if (kw->name == n) return true;
                    }
                    return false;
                },
                std::move(expect)};
}

Rule either(Rule a, Rule b) {
    std::string expect = a.expect + " or " + b.expect;
    return Rule{[fa = std::move(a.accepts), fb = std::move(b.accepts)](const value::Value& v) {
                    return fa(v) || fb(v);
                },
                std::move(expect)};
}

Rule seq_of(Rule item) {
    std::string expect = "a non-empty vector of " + item.expect;
    return Rule{[f = std::move(item.accepts)](const value::Value& v) {
                    const auto* xs = v.items();
                    if (!v.is_sequential() || !xs || xs->empty()) return false;
                    for (const auto& x : *xs) {
                        if (!f(x)) return false;
                    }
                    return true;
                },
                std::move(expect)};
}

Rule map_of(Rule key, Rule val) {
    std::string expect = "a map from " + key.expect + " to " + val.expect;
    return Rule{[fk = std::move(key.accepts), fv = std::move(val.accepts)](const value::Value& v) {
                    const auto* m = v.as_map();
                    if (!m) return false;
                    for (const auto& e : m->entries) {
                        if (!fk(e.key) || !fv(e.val)) return false;
                    }
                    return true;
                },
                std::move(expect)};
}

} // namespace rules

KeyTable& KeyTable::add(KeySpec spec) {
    for (auto& e : entries_) {
        if (e.name == spec.name) {
            e = std::move(spec);
            return *this;
        }
    }
    entries_.push_back(std::move(spec));
    return *this;
}

const KeySpec* KeyTable::find(std::string_view name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

namespace {

KeySpec key(std::string name, Rule rule, std::string doc) {
    KeySpec k{};
    k.name = std::move(name);
    k.rule = std::move(rule);
    k.doc = std::move(doc);
    return k;
}

KeySpec required(KeySpec k) {
    k.required = true;
    return k;
}

KeySpec nested(KeySpec k, Nesting how, std::shared_ptr<const KeyTable> table) {
    k.nesting = how;
    k.nested = std::move(table);
    return k;
}

std::shared_ptr<const KeyTable> build_foreign_lib() {
    using namespace rules;
    auto t = std::make_shared<KeyTable>("foreign-lib");
    t->add(required(key("file", string(), "Path or URL of the library.")))
        .add(required(key("provides", seq_of(string()), "Namespaces the library provides.")))
        .add(key("file-min", string(), "Minified variant used under advanced optimizations."))
        .add(key("requires", seq_of(string()), "Namespaces the library depends on."))
        .add(key("module-type", one_of({"commonjs", "amd", "es6"}), "Module system the library is written for."))
        .add(key("preprocess", string_or_named(), "Preprocessing step applied before compilation."));
    return t;
}

std::shared_ptr<const KeyTable> build_warnings() {
    auto t = std::make_shared<KeyTable>("warnings");
    static const char* const kNames[] = {
        "undeclared-ns-form", "protocol-deprecated", "undeclared-protocol-symbol",
        "fn-var", "invalid-arithmetic", "preamble-missing", "undeclared-var",
        "protocol-invalid-method", "variadic-max-arity", "multiple-variadic-overloads",
        "fn-deprecated", "redef", "fn-arity", "invalid-protocol-symbol", "dynamic",
        "undeclared-ns", "overload-arity", "extending-base-js-type",
        "single-segment-namespace", "protocol-duped-method", "protocol-multiple-impls",
        "invoke-ctor",
    };
    for (const char* n : kNames) {
        t->add(key(n, rules::boolean(), "Enables or disables this compiler warning."));
    }
    return t;
}

std::shared_ptr<const KeyTable> build_closure_warnings() {
    auto t = std::make_shared<KeyTable>("closure-warnings");
    static const char* const kNames[] = {
        "access-controls", "ambiguous-function-decl", "debugger-statement-present",
        "check-regexp", "check-types", "check-useless-code", "check-variables",
        "const", "constant-property", "deprecated", "duplicate-message", "es5-strict",
        "externs-validation", "fileoverview-jsdoc", "global-this",
        "internet-explorer-checks", "invalid-casts", "missing-properties",
        "non-standard-jsdoc", "strict-module-dep-check", "tweaks", "undefined-names",
        "undefined-variables", "unknown-defines", "visiblity",
    };
    for (const char* n : kNames) {
        t->add(key(n, rules::one_of({"error", "warning", "off"}), "Level of this Closure Compiler check."));
    }
    return t;
}

std::shared_ptr<const KeyTable> build_compiler_options() {
    using namespace rules;
    const auto foreign = build_foreign_lib();
    auto t = std::make_shared<KeyTable>("compiler-options");

    t->add(key("main", string_or_symbol(),
               "Entry point namespace; with :optimizations :none the compiler emits a loader for it."))
        .add(key("preloads", seq_of(symbol()),
                 "Namespaces loaded right after cljs.core, for development-time side effects."))
        .add(key("asset-path", string(),
                 "Relative URL the entry point script loads other scripts from."))
        .add(key("output-to", string(),
                 "Name of the JavaScript file the compiled output is written to."))
        .add(key("output-dir", string(),
                 "Directory for files generated during compilation. Defaults to \"out\"."))
        .add(key("optimizations", one_of({"none", "whitespace", "simple", "advanced"}),
                 "Closure optimization level. Defaults to :none."))
        .add(key("source-map", either(boolean(), string()),
                 "true/false under :none, otherwise the path the source map is written to."))
        .add(key("verbose", boolean(), "Emit details and measurements from compiler activity."))
        .add(key("pretty-print", boolean(), "Whether the JavaScript output is indented for reading."))
        .add(key("target", one_of({"nodejs"}), "Set to :nodejs when targeting Node.js."))
        .add(nested(key("foreign-libs", seq_of(map()), "External JavaScript libraries to include."),
                    Nesting::kEachMap, foreign))
        .add(key("externs", seq_of(string()), "Externs files for external libraries."))
        .add(key("modules", map_of(any(), map()), "Google Closure modules to split the output into."))
        .add(key("source-map-path", string(), "Path prefix used for source map URLs."))
        .add(key("source-map-timestamp", boolean(), "Append a cache-busting timestamp to source map URLs."))
        .add(key("cache-analysis", boolean(), "Cache analysis results between builds."))
        .add(key("recompile-dependents", boolean(), "Recompile namespaces that depend on a changed one."))
        .add(key("static-fns", boolean(), "Dispatch function calls statically where possible."))
        .add(key("elide-asserts", boolean(), "Remove assert calls from the output."))
        .add(key("pseudo-names", boolean(), "Readable names under :advanced optimizations."))
        .add(key("print-input-delimiter", boolean(), "Mark the start of each input file in the output."))
        .add(key("output-wrapper", boolean(), "Wrap the output in a function to protect the global scope."))
        .add(key("libs", seq_of(string()), "Closure-compatible library paths."))
        .add(key("preamble", seq_of(string()), "Files prepended to the output."))
        .add(key("hashbang", boolean(), "Emit a #! line when targeting Node.js."))
        .add(key("compiler-stats", boolean(), "Report compiler timings."))
        .add(key("language-in", one_of({"ecmascript3", "ecmascript5", "ecmascript5-strict"}),
                 "Language level of the input JavaScript."))
        .add(key("language-out", one_of({"ecmascript3", "ecmascript5", "ecmascript5-strict"}),
                 "Language level of the emitted JavaScript."))
        .add(key("closure-defines", map_of(string_or_symbol(), either(number(), either(string(), boolean()))),
                 "Values for Closure @define variables, e.g. {\"goog.DEBUG\" false}."))
        .add(key("closure-extra-annotations", seq_of(string()), "Extra JSDoc annotations Closure should accept."))
        .add(key("anon-fn-naming-policy", one_of({"off", "unmapped", "mapped"}),
                 "How Closure names anonymous functions."))
        .add(key("optimize-constants", boolean(), "Intern constant literals."))
        .add(key("parallel-build", boolean(), "Compile independent namespaces in parallel."))
        .add(key("devcards", boolean(), "Enable devcards."))
        .add(key("dump-core", boolean(), "Include the analysis cache of cljs.core."))
        .add(key("emit-constants", boolean(), "Emit constants table."))
        .add(key("warning-handlers", seq_of(any()), "Functions called for each compiler warning."))
        .add(key("source-map-inline", boolean(), "Inline source maps into the output."))
        .add(key("ups-libs", seq_of(string()), "Libraries contributed by dependencies."))
        .add(key("ups-externs", seq_of(string()), "Externs contributed by dependencies."))
        .add(nested(key("ups-foreign-libs", seq_of(map()), "Foreign libraries contributed by dependencies."),
                    Nesting::kEachMap, foreign))
        .add(key("closure-output-charset", string(), "Charset of the emitted JavaScript."))
        .add(key("external-config", map_of(keyword(), map()),
                 "Configuration for external tools keyed by tool name."))
        .add(nested(key("warnings", either(boolean(), map()), "Enable or disable compiler warnings."),
                    Nesting::kMap, build_warnings()))
        .add(nested(key("closure-warnings", map(), "Levels for Closure Compiler checks."),
                    Nesting::kMap, build_closure_warnings()));
    return t;
}

std::shared_ptr<const KeyTable> build_build_options() {
    using namespace rules;
    auto t = std::make_shared<KeyTable>("build-options");
    t->add(key("id", string_or_named(), "Name of the build."))
        .add(required(key("source-paths", seq_of(string()), "Directories holding the build's sources.")))
        .add(required(nested(key("compiler", map(), "Options passed to the ClojureScript compiler."),
                             Nesting::kMap, cljs_compiler_options())))
        .add(key("figwheel", either(boolean(), map()), "Figwheel client options, or true."))
        .add(key("notify-command", seq_of(string()), "Command run after each build."))
        .add(key("jar", boolean(), "Include the build output in the jar."))
        .add(key("incremental", boolean(), "Keep compiler state between builds."))
        .add(key("assert", boolean(), "Emit assertions."))
        .add(key("warning-handlers", seq_of(any()), "Functions called for each compiler warning."));
    return t;
}

} // namespace

std::shared_ptr<const KeyTable> cljs_compiler_options() {
    static const std::shared_ptr<const KeyTable> table = build_compiler_options();
    return table;
}

std::shared_ptr<const KeyTable> cljs_build_options() {
    static const std::shared_ptr<const KeyTable> table = build_build_options();
    return table;
}

} // namespace ednpath::schema
