#include <ednpath/cst/Cursor.hpp>
#include <ednpath/nav/Direction.hpp>
#include <ednpath/nav/Location.hpp>
#include <ednpath/nav/Path.hpp>
#include <ednpath/nav/Resolve.hpp>
#include <ednpath/parse/Parser.hpp>
#include <ednpath/value/Decode.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

    using ednpath::nav::KeySegment;
    using ednpath::nav::Path;
    using ednpath::nav::ValueSource;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static ednpath::cst::NodePtr parse_doc(const std::string& src) {
        ednpath::diag::Bag bag{};
        return ednpath::parse::parse_source(src, "<doc>", bag);
    }

    static Path P(const std::string& text) {
        ednpath::diag::Bag bag{};
        auto p = ednpath::nav::parse_path(text, bag);
        if (!p) {
            std::cerr << "  - bad test path " << text << "\n" << bag.render_text();
            return {};
        }
        return *p;
    }

    static ednpath::value::Value V(const std::string& edn) {
        auto v = ednpath::value::read_value(edn);
        if (!v) std::cerr << "  - bad test value " << edn << "\n";
        return v.value_or(ednpath::value::make_nil());
    }

    static std::optional<ednpath::nav::Location> locate_text(
        const std::string& path,
        const std::string& text,
        const ednpath::nav::ResolveOptions& opt = {}
    ) {
        return ednpath::nav::locate(P(path), text, "<doc>", opt);
    }

    static bool expect_at_(const std::optional<ednpath::nav::Location>& loc,
                           uint32_t line, uint32_t column, const std::string& value_edn) {
        if (!loc) {
            std::cerr << "  - expected a location, got none\n";
            return false;
        }
        bool ok = true;
        if (loc->line != line || loc->column != column) {
            std::cerr << "  - expected " << line << ":" << column
                      << ", got " << loc->line << ":" << loc->column << "\n";
            ok = false;
        }
        if (!loc->value || *loc->value != V(value_edn)) {
            std::cerr << "  - expected value " << value_edn << ", got "
                      << (loc->value ? ednpath::value::to_edn(*loc->value) : std::string("<none>")) << "\n";
            ok = false;
        }
        return ok;
    }

    static bool test_map_lookup() {
        const auto loc = locate_text("[:b]", "{:a 1 :b 2}");
        bool ok = expect_at_(loc, 1, 7, "2");
        if (loc) {
            ok &= require_(loc->value_source == ValueSource::kPairedValue, "value must come from the pair");
            ok &= require_(loc->cursor.node().text == ":b", "cursor must rest on the key token");
            ok &= require_(loc->file == "<doc>", "file must be carried through");
            ok &= require_(loc->path == P("[:b]"), "path must be carried through");
        }
        return ok;
    }

    static bool test_nested_path() {
        const auto loc = locate_text("[:a :b 2]", "{:a {:b [10 20 30]}}");
        bool ok = expect_at_(loc, 1, 16, "30");
        if (loc) ok &= require_(loc->value_source == ValueSource::kSelf, "sequence element decodes itself");
        return ok;
    }

    static bool test_missing_key_is_absence() {
        bool ok = true;
        ok &= require_(!locate_text("[:z]", "{:a 1}").has_value(), "missing key must give absence");
        ok &= require_(!locate_text("[:a :z]", "{:a {:b 1}}").has_value(), "missing nested key must give absence");
        ok &= require_(!locate_text("[:a :b]", "{:a 1}").has_value(), "stepping into a scalar must give absence");

        ednpath::diag::Bag why{};
        const auto loc = ednpath::nav::locate(P("[:z]"), "{:a 1}", "<doc>", {}, &why);
        ok &= require_(!loc.has_value(), "absence expected");
        ok &= require_(why.has_code(ednpath::diag::Code::R_PATH_NOT_FOUND), "why must say the path was not found");
        return ok;
    }

    static bool test_sequence_out_of_range() {
        bool ok = true;
        ok &= require_(!locate_text("[5]", "[1 2 3]").has_value(), "index past the end must give absence");
        ok &= require_(!locate_text("[3]", "[1 2 3]").has_value(), "index == size must give absence");
        ok &= expect_at_(locate_text("[2]", "[1 2 3]"), 1, 6, "3");
        ok &= expect_at_(locate_text("[0]", "\n(x y)"), 2, 2, "x");
        return ok;
    }

    static bool test_keyword_against_sequence_throws() {
        bool ok = true;
        bool threw = false;
        try {
            (void)locate_text("[:x]", "[1 2 3]");
        } catch (const ednpath::nav::ContractViolation& e) {
            threw = true;
            ok &= require_(std::string(e.what()).find(":x") != std::string::npos, "message must name the segment");
        }
        ok &= require_(threw, "keyword against a vector must throw ContractViolation");

        threw = false;
        try {
            (void)locate_text("[:a \"s\"]", "{:a (1 2)}");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ok &= require_(threw, "string key against a plain list must throw");
        return ok;
    }

    static bool test_call_form_keyword_region() {
        const std::string src = "(defproject \"proj\" \"1.0\" :deps [a b])";
        const auto loc = locate_text("[:deps]", src);
        bool ok = expect_at_(loc, 1, 26, "[a b]");
        if (loc) ok &= require_(loc->value_source == ValueSource::kPairedValue, "call-form key pairs with its value");

        // positional strings never act as keys
        ok &= require_(!locate_text("[\"proj\"]", src).has_value(), "positional argument must not match as a key");
        return ok;
    }

    static bool test_call_form_custom_head() {
        ednpath::nav::ResolveOptions opt{};
        opt.call_form_head = "name";
        const std::string src = "{:deps 0}\n(name \"proj\" \"1.0\" :deps [x])";

        bool ok = expect_at_(locate_text("[:deps]", src, opt), 2, 20, "[x]");
        // with the default head the map comes first
        ok &= expect_at_(locate_text("[:deps]", src), 1, 2, "0");
        return ok;
    }

    static bool test_call_form_index_counts_head() {
        const std::string src = "(defproject demo \"1.0\"\n  :a 1)";
        bool ok = true;
        ok &= expect_at_(locate_text("[0]", src), 1, 2, "defproject");
        ok &= expect_at_(locate_text("[1]", src), 1, 13, "demo");
        ok &= expect_at_(locate_text("[2]", src), 1, 18, "\"1.0\"");
        ok &= require_(!locate_text("[5]", src).has_value(), "index past the form must give absence");
        return ok;
    }

    static bool test_set_is_absence() {
        bool ok = true;
        ok &= require_(!locate_text("[0]", "#{1 2 3}").has_value(), "index into a set must give absence");
        ok &= require_(!locate_text("[:a]", "#{:a}").has_value(), "key into a set must give absence");
        ok &= require_(!locate_text("[:s 0]", "{:s #{1 2}}").has_value(), "nested set must give absence");
        ok &= expect_at_(locate_text("[:s]", "{:s #{1 2}}"), 1, 2, "#{1 2}");
        return ok;
    }

    static bool test_other_kinds_are_absence() {
        bool ok = true;
        ok &= require_(!locate_text("[:a 0]", "{:a \"text\"}").has_value(), "string has no positions");
        ok &= require_(!locate_text("[:a 0]", "{:a #(inc %)}").has_value(), "anonymous fn has no positions");
        ok &= require_(!locate_text("[:a :b]", "{:a #inst \"2020\"}").has_value(), "tagged literal has no positions");
        return ok;
    }

    static bool test_key_kinds() {
        bool ok = true;
        ok &= expect_at_(locate_text("[\"goog.DEBUG\"]", "{\"goog.DEBUG\" false}"), 1, 2, "false");
        ok &= expect_at_(locate_text("[dev]", "{dev {:a 1} test {:a 2}}"), 1, 2, "{:a 1}");
        ok &= expect_at_(locate_text("[test]", "{dev {:a 1} test {:a 2}}"), 1, 13, "{:a 2}");
        ok &= expect_at_(locate_text("[2]", "{1 \"one\" 2 \"two\"}"), 1, 10, "\"two\"");
        ok &= expect_at_(locate_text("[:ns/k]", "{:ns/k 1 :k 2}"), 1, 2, "1");
        ok &= require_(!locate_text("[:a]", "{\"a\" 1}").has_value(), "keyword must not match a string key");
        return ok;
    }

    static bool test_trivia_between_pairs() {
        const std::string src =
            "; header\n"
            "{:a ; why\n"
            "  1\n"
            "\n"
            " #_ :skipped #_ 0\n"
            " :b, 2}\n";
        bool ok = true;
        ok &= expect_at_(locate_text("[:a]", src), 2, 2, "1");
        ok &= expect_at_(locate_text("[:b]", src), 6, 2, "2");
        return ok;
    }

    static bool test_trailing_key_without_value() {
        const std::string src = "{:a 1 :b}";
        bool ok = true;
        const auto loc = locate_text("[:b]", src);
        ok &= expect_at_(loc, 1, 7, ":b");
        if (loc) ok &= require_(loc->value_source == ValueSource::kSelf, "unpaired key decodes itself");

        const auto top = ednpath::nav::initial_position(ednpath::cst::Cursor(parse_doc(src)));
        ok &= require_(top.has_value(), "map must be the start");
        if (top) {
            ok &= require_(!ednpath::nav::get_value_at_path(P("[:b]"), *top).has_value(),
                           "an unpaired key has no value");
        }
        return ok;
    }

    static bool test_undecodable_value_falls_back_to_key() {
        const auto loc = locate_text("[:f]", "{:f #(inc %)}");
        bool ok = expect_at_(loc, 1, 2, ":f");
        if (loc) ok &= require_(loc->value_source == ValueSource::kSelf, "fallback must be reported as self");
        return ok;
    }

    static bool test_initial_position_rules() {
        bool ok = true;
        // the call form wins over an earlier collection
        ok &= expect_at_(locate_text("[:x]", "{:x 1}\n(defproject p \"1\" :x 2)"), 2, 19, "2");
        // discarded forms are not data
        ok &= expect_at_(locate_text("[:a]", "#_ (defproject skip \"0\" :a 1)\n#_{:a 0}\n{:a 2}"), 3, 2, "2");
        // a nested call form still counts
        ok &= expect_at_(locate_text("[:k]", "[(defproject p \"1\" :k v)]"), 1, 20, "v");

        ednpath::diag::Bag why{};
        const auto none = ednpath::nav::locate(P("[0]"), "sym 42 \"s\"", "<doc>", {}, &why);
        ok &= require_(!none.has_value(), "document without collections must give absence");
        ok &= require_(why.has_code(ednpath::diag::Code::R_NO_INITIAL_FORM), "why must name the missing start form");
        return ok;
    }

    static bool test_empty_path_is_absence() {
        bool ok = true;
        ok &= require_(!ednpath::nav::locate({}, "{:a 1}", "<doc>").has_value(), "empty path must give absence");
        return ok;
    }

    static bool test_reader_errors_are_absence() {
        ednpath::diag::Bag why{};
        const auto loc = ednpath::nav::locate(P("[:a]"), "{:a [1 2}", "<doc>", {}, &why);
        bool ok = require_(!loc.has_value(), "malformed document must give absence");
        ok &= require_(why.has_code(ednpath::diag::Code::C_UNBALANCED_DELIMITER), "reader diagnostics must be passed on");
        return ok;
    }

    static bool test_deep_document_is_absence() {
        const size_t levels = 20000;
        const std::string src = std::string(levels, '[') + std::string(levels, ']');
        ednpath::diag::Bag why{};
        const auto loc = ednpath::nav::locate(P("[0]"), src, "<doc>", {}, &why);
        bool ok = require_(!loc.has_value(), "a document nested past the reader's limit gives absence");
        ok &= require_(why.has_code(ednpath::diag::Code::C_NESTING_TOO_DEEP), "the nesting diagnostic is passed on");
        return ok;
    }

    static bool test_line_number_counts_newlines() {
        const std::string src = "\n;; c\n\n{:a 0\n\n\n  :b 1}";
        const auto root = parse_doc(src);
        const ednpath::cst::Cursor top(root);
        bool ok = true;

        ok &= require_(ednpath::nav::line_number(top) == 1, "root is on line 1");

        size_t newlines = 0;
        for (const auto& c : ednpath::nav::direction(ednpath::nav::step::next, top)) {
            if (ednpath::nav::line_number(c) != newlines + 1) {
                std::cerr << "  - line mismatch at node '" << c.node().text << "'\n";
                ok = false;
                break;
            }
            if (c.node().kind == ednpath::syntax::NodeKind::kNewline) ++newlines;
        }
        ok &= require_(newlines == 6, "six newline nodes expected");
        ok &= expect_at_(ednpath::nav::locate(P("[:b]"), src, "<doc>"), 7, 3, "1");
        return ok;
    }

    static bool test_find_key_primitives() {
        const std::string src = "{:a 1 :b [7 8]}";
        const auto root = parse_doc(src);
        const auto map = *ednpath::nav::initial_position(ednpath::cst::Cursor(root));
        bool ok = true;

        const auto key = ednpath::nav::find_key_in_node(KeySegment::keyword("b"), map);
        ok &= require_(key && key->node().text == ":b", "find_key_in_node must return the key token");
        const auto val = ednpath::nav::find_key_value_in_node(KeySegment::keyword("b"), map);
        ok &= require_(val && val->node().kind == ednpath::syntax::NodeKind::kVector,
                       "find_key_value_in_node must return the paired value");
        ok &= require_(!ednpath::nav::find_key_in_node(KeySegment::keyword("c"), map).has_value(),
                       "no match gives absence");

        ok &= require_(key && ednpath::nav::is_key_position(*key), ":b is in key position");
        ok &= require_(val && !ednpath::nav::is_key_position(*val), "the vector is in value position");

        const auto eight = ednpath::nav::get_value_at_path(P("[:b 1]"), map);
        ok &= require_(eight && eight->node().text == "8", "get_value_at_path reaches the element");
        ok &= require_(eight && !ednpath::nav::is_key_position(*eight), "vector elements are never keys");

        const auto ex = ednpath::nav::extract_value(*key);
        ok &= require_(ex.source == ValueSource::kPairedValue && ex.value == V("[7 8]"),
                       "extract_value must prefer the paired value");
        const auto ex_self = ednpath::nav::extract_value(*eight);
        ok &= require_(ex_self.source == ValueSource::kSelf && ex_self.value == V("8"),
                       "extract_value on an element decodes the element");
        return ok;
    }

    static bool test_determinism() {
        const std::string src = "(defproject p \"1\"\n  :m {:k [1 {:x \"y\"}]})";
        const auto a = locate_text("[:m :k 1 :x]", src);
        const auto b = locate_text("[:m :k 1 :x]", src);
        bool ok = require_(a.has_value() && b.has_value(), "both runs must resolve");
        if (!ok) return false;
        ok &= require_(a->line == b->line && a->column == b->column, "same position on every run");
        ok &= require_(a->value == b->value && a->value_source == b->value_source, "same value on every run");

        const auto root = parse_doc(src);
        const auto c = ednpath::nav::locate_in(P("[:m :k 1 :x]"), root, "<doc>");
        const auto d = ednpath::nav::locate_in(P("[:m :k 1 :x]"), root, "<doc>");
        ok &= require_(c && d && c->cursor == d->cursor, "same tree gives the same cursor");
        ok &= expect_at_(c, 2, 14, "\"y\"");
        return ok;
    }

    static bool test_concurrent_resolution() {
        std::string src = "{:items [";
        for (int i = 0; i < 64; ++i) src += "{:id " + std::to_string(i) + "}\n";
        src += "]}";
        const auto root = parse_doc(src);

        constexpr int kThreads = 8;
        std::vector<int> bad(kThreads, 0);
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&, t]() {
                for (int i = 0; i < 64; ++i) {
                    Path p{KeySegment::keyword("items"), KeySegment::at(static_cast<uint64_t>(i)),
                           KeySegment::keyword("id")};
                    const auto loc = ednpath::nav::locate_in(p, root, "<doc>");
                    if (!loc || loc->line != static_cast<uint32_t>(i + 1) ||
                        !loc->value || *loc->value != ednpath::value::make_int(i)) {
                        ++bad[static_cast<size_t>(t)];
                    }
                }
            });
        }
        for (auto& w : workers) w.join();

        bool ok = true;
        for (int t = 0; t < kThreads; ++t) {
            ok &= require_(bad[static_cast<size_t>(t)] == 0, "a worker saw a wrong location");
        }
        return ok;
    }

    static bool test_locate_file_project() {
#ifndef EDNPATH_TEST_CASE_DIR
        std::cerr << "  - EDNPATH_TEST_CASE_DIR is not defined\n";
        return false;
#else
        const std::string file = (std::filesystem::path(EDNPATH_TEST_CASE_DIR) / "project.clj").string();
        auto at = [&](const std::string& path) { return ednpath::nav::locate_file(P(path), file); };

        bool ok = true;
        ok &= expect_at_(at("[:description]"), 3, 3, "\"An example project\"");
        ok &= expect_at_(at("[:plugins]"), 6, 3, "[[lein-cljsbuild \"1.1.4\"]]");
        ok &= expect_at_(at("[:dependencies 1 0]"), 5, 19, "org.clojure/clojurescript");
        ok &= expect_at_(at("[1]"), 2, 13, "example");
        ok &= expect_at_(at("[:cljsbuild :builds 0 :id]"), 7, 25, "\"dev\"");
        ok &= expect_at_(at("[:cljsbuild :builds 0 :compiler :main]"), 9, 36, "example.core");
        ok &= expect_at_(at("[:cljsbuild :builds 0 :compiler :optimiztions]"), 11, 36, ":none");

        const auto loc = at("[:cljsbuild :builds 0 :compiler]");
        ok &= require_(loc && loc->line == 9 && loc->column == 25, ":compiler key position");
        ok &= require_(loc && loc->value && loc->value->is_map(), ":compiler value must decode as a map");

        ednpath::diag::Bag why{};
        const auto missing = ednpath::nav::locate_file(P("[:a]"), file + ".missing", {}, &why);
        ok &= require_(!missing.has_value(), "missing file must give absence");
        ok &= require_(why.has_code(ednpath::diag::Code::R_FILE_NOT_FOUND), "missing file must be reported");
        return ok;
#endif
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"map_lookup", test_map_lookup},
        {"nested_path", test_nested_path},
        {"missing_key_is_absence", test_missing_key_is_absence},
        {"sequence_out_of_range", test_sequence_out_of_range},
        {"keyword_against_sequence_throws", test_keyword_against_sequence_throws},
        {"call_form_keyword_region", test_call_form_keyword_region},
        {"call_form_custom_head", test_call_form_custom_head},
        {"call_form_index_counts_head", test_call_form_index_counts_head},
        {"set_is_absence", test_set_is_absence},
        {"other_kinds_are_absence", test_other_kinds_are_absence},
        {"key_kinds", test_key_kinds},
        {"trivia_between_pairs", test_trivia_between_pairs},
        {"trailing_key_without_value", test_trailing_key_without_value},
        {"undecodable_value_falls_back_to_key", test_undecodable_value_falls_back_to_key},
        {"initial_position_rules", test_initial_position_rules},
        {"empty_path_is_absence", test_empty_path_is_absence},
        {"reader_errors_are_absence", test_reader_errors_are_absence},
        {"deep_document_is_absence", test_deep_document_is_absence},
        {"line_number_counts_newlines", test_line_number_counts_newlines},
        {"find_key_primitives", test_find_key_primitives},
        {"determinism", test_determinism},
        {"concurrent_resolution", test_concurrent_resolution},
        {"locate_file_project", test_locate_file_project},
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
