#include <ednpath/diag/Render.hpp>
#include <ednpath/nav/Path.hpp>
#include <ednpath/parse/Parser.hpp>
#include <ednpath/schema/Check.hpp>
#include <ednpath/schema/KeyTable.hpp>
#include <ednpath/schema/Suggest.hpp>
#include <ednpath/text/SourceManager.hpp>
#include <ednpath/value/Decode.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

    namespace schema = ednpath::schema;
    namespace value = ednpath::value;
    using ednpath::diag::Code;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static value::Value V(const std::string& edn) {
        auto v = value::read_value(edn);
        if (!v) std::cerr << "  - bad test value " << edn << "\n";
        return v.value_or(value::make_nil());
    }

    static ednpath::nav::Path P(const std::string& text) {
        ednpath::diag::Bag bag{};
        return ednpath::nav::parse_path(text, bag).value_or(ednpath::nav::Path{});
    }

    static bool test_edit_distance() {
        bool ok = true;
        ok &= require_(schema::edit_distance("", "abc") == 3, "empty to abc");
        ok &= require_(schema::edit_distance("kitten", "sitting") == 3, "kitten/sitting");
        ok &= require_(schema::edit_distance("same", "same") == 0, "identical");
        ok &= require_(schema::edit_distance("optimiztions", "optimizations") == 1, "one insertion");
        return ok;
    }

    static bool test_suggest_key() {
        const auto table = schema::cljs_compiler_options();
        bool ok = true;
        ok &= require_(schema::suggest_key("optimiztions", *table) == std::optional<std::string>("optimizations"),
                       "near miss must be suggested");
        ok &= require_(schema::suggest_key("output_dir", *table) == std::optional<std::string>("output-dir"),
                       "underscore spelling must be suggested");
        ok &= require_(schema::suggest_key("SourceMapPath", *table) == std::optional<std::string>("source-map-path"),
                       "folded spelling must be suggested");
        ok &= require_(!schema::suggest_key("completely-unrelated", *table).has_value(), "no suggestion for noise");
        return ok;
    }

    static bool test_key_table_order_and_replace() {
        schema::KeyTable t("demo");
        schema::KeySpec a{};
        a.name = "a";
        a.rule = schema::rules::integer();
        schema::KeySpec b{};
        b.name = "b";
        b.rule = schema::rules::string();
        t.add(a).add(b);

        schema::KeySpec a2 = a;
        a2.rule = schema::rules::boolean();
        a2.doc = "replaced";
        t.add(a2);

        bool ok = true;
        ok &= require_(t.size() == 2, "replacing must not grow the table");
        ok &= require_(t.entries()[0].name == "a" && t.entries()[1].name == "b", "insertion order is kept");
        ok &= require_(t.find("a") && t.find("a")->doc == "replaced", "add replaces by name");
        ok &= require_(t.find("zzz") == nullptr, "unknown key lookup");
        return ok;
    }

    static bool test_rules() {
        using namespace schema::rules;
        bool ok = true;
        ok &= require_(one_of({"none", "advanced"}).accepts(V(":none")), "one_of accepts a listed keyword");
        ok &= require_(!one_of({"none", "advanced"}).accepts(V(":fast")), "one_of rejects others");
        ok &= require_(!one_of({"none"}).accepts(V("\"none\"")), "one_of wants keywords");
        ok &= require_(one_of({"none", "advanced"}).expect == "one of :none :advanced", "one_of description");
        ok &= require_(seq_of(string()).accepts(V("[\"a\" \"b\"]")), "seq_of accepts a vector");
        ok &= require_(seq_of(string()).accepts(V("(\"a\")")), "seq_of accepts a list");
        ok &= require_(!seq_of(string()).accepts(V("[]")), "seq_of rejects empty");
        ok &= require_(!seq_of(string()).accepts(V("[\"a\" 1]")), "seq_of checks every item");
        ok &= require_(!seq_of(string()).accepts(V("#{\"a\"}")), "seq_of rejects sets");
        ok &= require_(either(boolean(), string()).accepts(V("\"x\"")), "either accepts the second");
        ok &= require_(!either(boolean(), string()).accepts(V("1")), "either rejects neither");
        ok &= require_(map_of(keyword(), map()).accepts(V("{:a {} :b {:c 1}}")), "map_of accepts");
        ok &= require_(!map_of(keyword(), map()).accepts(V("{:a 1}")), "map_of checks values");
        ok &= require_(number().accepts(V("1/2")) && number().accepts(V("2.5")), "number accepts all numbers");
        return ok;
    }

    static bool test_check_valid_compiler_map() {
        const auto v = V(
            "{:main example.core :output-to \"out/main.js\" :optimizations :advanced"
            " :source-map \"out/main.js.map\" :externs [\"x.js\"]"
            " :closure-defines {\"goog.DEBUG\" false}"
            " :foreign-libs [{:file \"w.js\" :provides [\"w\"]}]"
            " :warnings {:fn-deprecated false}}");
        const auto out = schema::check_strict_map(v, *schema::cljs_compiler_options());
        bool ok = require_(out.empty(), "valid compiler options must pass");
        for (const auto& viol : out) std::cerr << "    " << viol.message << "\n";
        return ok;
    }

    static bool test_check_reports_each_kind() {
        const auto v = V("{:optimiztions :none :pretty-print \"yes\" \"main\" 1}");
        const auto out = schema::check_strict_map(v, *schema::cljs_compiler_options(), P("[:compiler]"));
        bool ok = require_(out.size() == 3, "three violations expected");
        if (!ok) return false;

        ok &= require_(out[0].kind == schema::ViolationKind::kUnknownKey, "first is an unknown key");
        ok &= require_(out[0].path == P("[:compiler :optimiztions]"), "unknown key path");
        ok &= require_(out[0].suggestion == std::optional<std::string>("optimizations"), "suggestion recorded");
        ok &= require_(out[0].message == "unknown key :optimiztions in compiler-options", "unknown key message");

        ok &= require_(out[1].kind == schema::ViolationKind::kInvalidValue, "second is an invalid value");
        ok &= require_(out[1].message == "value of :pretty-print must be true or false, got \"yes\"",
                       "invalid value message");
        ok &= require_(!out[1].doc.empty(), "documentation is attached");

        ok &= require_(out[2].kind == schema::ViolationKind::kUnknownKey, "string key is unknown");
        ok &= require_(out[2].path == P("[:compiler \"main\"]"), "string key path");
        ok &= require_(!out[2].suggestion.has_value(), "no suggestion for a non-keyword key");
        return ok;
    }

    static bool test_check_not_a_map_and_long_values() {
        bool ok = true;
        const auto out = schema::check_strict_map(V("[1 2]"), *schema::cljs_compiler_options());
        ok &= require_(out.size() == 1 && out[0].kind == schema::ViolationKind::kNotAMap, "vector is not a map");
        ok &= require_(out.size() == 1 && out[0].message == "expected a map of compiler-options, got vector",
                       "not-a-map message");

        std::string long_str = "\"";
        long_str += std::string(80, 'x');
        long_str += "\"";
        const auto out2 = schema::check_strict_map(V("{:verbose " + long_str + "}"), *schema::cljs_compiler_options());
        ok &= require_(out2.size() == 1, "one violation for the long value");
        if (out2.size() == 1) {
            const auto& m = out2[0].message;
            ok &= require_(m.size() > 3 && m.compare(m.size() - 3, 3, "...") == 0, "long values are shortened");
        }
        return ok;
    }

    static bool test_check_nested_tables() {
        const auto v = V(
            "{:source-paths [\"src\"]"
            " :compiler {:warnings {:fn-deprecatd false}"
            "            :foreign-libs [{:file \"a.js\" :provides [\"a\"]} {:file \"b.js\"}]}}");
        const auto out = schema::check_strict_map(v, *schema::cljs_build_options());
        bool ok = require_(out.size() == 2, "two nested violations expected");
        if (!ok) {
            for (const auto& viol : out) std::cerr << "    " << viol.message << "\n";
            return false;
        }
        ok &= require_(out[0].path == P("[:compiler :warnings :fn-deprecatd]"), "nested map path");
        ok &= require_(out[0].suggestion == std::optional<std::string>("fn-deprecated"), "nested suggestion");
        ok &= require_(out[1].kind == schema::ViolationKind::kMissingKey, "missing :provides");
        ok &= require_(out[1].path == P("[:compiler :foreign-libs 1]"), "each-map path carries the index");
        ok &= require_(out[1].message == "missing required key :provides in foreign-lib", "missing key message");
        return ok;
    }

    static bool test_missing_required_keys_come_last() {
        const auto out = schema::check_strict_map(V("{:id \"dev\" :jar 1}"), *schema::cljs_build_options());
        bool ok = require_(out.size() == 3, "invalid :jar plus two missing keys");
        if (!ok) return false;
        ok &= require_(out[0].kind == schema::ViolationKind::kInvalidValue, "value problems first");
        ok &= require_(out[1].kind == schema::ViolationKind::kMissingKey && out[2].kind == schema::ViolationKind::kMissingKey,
                       "missing keys last");
        ok &= require_(out[1].path.empty(), "missing keys point at the map itself");
        return ok;
    }

    static bool test_report_positions() {
        const std::string src =
            "(defproject p \"1\"\n"
            "  :compiler {:main x\n"
            "             :optimiztions :none\n"
            "             :verbose \"yes\"})\n";
        ednpath::diag::Bag reader{};
        const auto root = ednpath::parse::parse_source(src, "p.clj", reader);
        bool ok = require_(!reader.has_error(), "document must parse");

        std::vector<schema::Violation> viols = schema::check_strict_map(
            V("{:main x :optimiztions :none :verbose \"yes\"}"), *schema::cljs_compiler_options(), P("[:compiler]"));

        schema::Violation lost{};
        lost.kind = schema::ViolationKind::kInvalidValue;
        lost.path = P("[:nowhere :x]");
        lost.message = "not in the document";
        viols.push_back(lost);

        schema::Violation whole{};
        whole.kind = schema::ViolationKind::kNotAMap;
        whole.message = "top form";
        viols.push_back(whole);

        ednpath::diag::Bag bag{};
        schema::report(viols, root, "p.clj", bag);
        ok &= require_(bag.size() == 4, "one diagnostic per violation");
        if (bag.size() != 4) return false;

        const auto& d = bag.all();
        ok &= require_(d[0].code == Code::S_UNKNOWN_KEY && d[0].line == 3 && d[0].column == 14, "unknown key position");
        ok &= require_(d[0].note == "did you mean :optimizations?", "suggestion note");
        ok &= require_(d[0].path == "[:compiler :optimiztions]", "path kept on the diagnostic");
        ok &= require_(d[1].code == Code::S_INVALID_VALUE && d[1].line == 4 && d[1].column == 14, "invalid value position");
        ok &= require_(d[2].line == 0 && d[2].path == "[:nowhere :x]", "unresolved path keeps line 0");
        ok &= require_(d[3].code == Code::S_NOT_A_MAP && d[3].line == 1 && d[3].column == 1, "empty path uses the start form");
        return ok;
    }

    static bool test_render_with_source() {
        const std::string src = "{:a 1\n :verbose \"yes\"\n :c 3}\n";
        ednpath::text::SourceManager sm{};
        sm.add("cfg.edn", src);

        ednpath::diag::Bag reader{};
        const auto root = ednpath::parse::parse_source(src, "cfg.edn", reader);

        ednpath::diag::Bag bag{};
        schema::report(schema::check_strict_map(V("{:a 1 :verbose \"yes\" :c 3}"), *schema::cljs_compiler_options()),
                       root, "cfg.edn", bag);
        const auto text = ednpath::diag::render_with_source(bag, sm, 1);

        bool ok = true;
        ok &= require_(text.find("error[S_UNKNOWN_KEY]: unknown key :a in compiler-options") != std::string::npos,
                       "header line");
        ok &= require_(text.find(" --> cfg.edn:1:2") != std::string::npos, "location line");
        ok &= require_(text.find("2 |  :verbose \"yes\"") != std::string::npos, "code frame shows the line");
        ok &= require_(text.find("  |  ^") != std::string::npos, "caret under the key");
        ok &= require_(text.find("error[S_INVALID_VALUE]") != std::string::npos, "invalid value rendered");

        ednpath::diag::Diagnostic unknown{};
        unknown.code = Code::S_UNKNOWN_KEY;
        unknown.file = "other.edn";
        unknown.line = 0;
        unknown.path = "[:x]";
        unknown.message = "m";
        const auto plain = ednpath::diag::render_one_context(unknown, sm, 2);
        ok &= require_(plain == "error[S_UNKNOWN_KEY]: m\n --> other.edn (path [:x])\n", "fallback form");
        return ok;
    }

    static bool test_source_manager_lines() {
        ednpath::text::SourceManager sm{};
        const auto id = sm.add("a.edn", "one\r\ntwo\nthree");
        bool ok = true;
        ok &= require_(sm.find("a.edn") == std::optional<uint32_t>(id), "find by name");
        ok &= require_(!sm.find("b.edn").has_value(), "unknown name");
        ok &= require_(sm.line_count(id) == 3, "three lines");
        ok &= require_(sm.line_text(id, 1) == "one", "CR is stripped");
        ok &= require_(sm.line_text(id, 3) == "three", "last line without newline");
        ok &= require_(sm.line_text(id, 9).empty(), "out of range is empty");

        const auto blk = sm.snippet_block(id, 2, 2, 5);
        ok &= require_(blk.first_line_no == 1 && blk.lines.size() == 3, "context is clamped to the file");
        ok &= require_(blk.caret_line_offset == 1 && blk.caret_cols_before == 1, "caret placement");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"edit_distance", test_edit_distance},
        {"suggest_key", test_suggest_key},
        {"key_table_order_and_replace", test_key_table_order_and_replace},
        {"rules", test_rules},
        {"check_valid_compiler_map", test_check_valid_compiler_map},
        {"check_reports_each_kind", test_check_reports_each_kind},
        {"check_not_a_map_and_long_values", test_check_not_a_map_and_long_values},
        {"check_nested_tables", test_check_nested_tables},
        {"missing_required_keys_come_last", test_missing_required_keys_come_last},
        {"report_positions", test_report_positions},
        {"render_with_source", test_render_with_source},
        {"source_manager_lines", test_source_manager_lines},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.def();
        if (!ok) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }

    std::cout << "ALL TESTS PASSED\n";
    return 0;
}
