#include <ednpath/nav/Path.hpp>
#include <ednpath/value/Decode.hpp>
#include <ednpath/value/Value.hpp>

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

    namespace value = ednpath::value;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool expect_edn_(const std::string& src, const std::string& printed) {
        const auto v = value::read_value(src);
        if (!v) {
            std::cerr << "  - failed to read: " << src << "\n";
            return false;
        }
        const auto got = value::to_edn(*v);
        if (got != printed) {
            std::cerr << "  - " << src << " printed as " << got << ", expected " << printed << "\n";
            return false;
        }
        return true;
    }

    static bool test_scalars() {
        bool ok = true;
        ok &= require_(value::read_value("nil")->is_nil(), "nil");
        ok &= require_(*value::read_value("true")->as_bool(), "true");
        ok &= require_(!*value::read_value("false")->as_bool(), "false");
        ok &= require_(*value::read_value("-42")->as_int() == -42, "negative int");
        ok &= require_(*value::read_value("0x1F")->as_int() == 31, "hex int");
        ok &= require_(*value::read_value("017")->as_int() == 15, "octal int");
        ok &= require_(*value::read_value("2r1010")->as_int() == 10, "radix int");
        ok &= require_(value::read_value("3.5")->is_float(), "float");
        ok &= require_(value::read_value("1e3")->is_float(), "exponent float");
        ok &= require_(value::read_value(":ns/k")->as_keyword()->name == "ns/k", "namespaced keyword");
        ok &= require_(value::read_value("foo.bar/baz")->as_symbol()->name == "foo.bar/baz", "symbol");
        ok &= require_(*value::read_value("\"a\\tb\\u0041\"")->as_string() == "a\tbA", "string escapes");
        ok &= require_(*value::read_value("\"\\101\"")->as_string() == "A", "octal string escape");
        return ok;
    }

    static bool test_big_and_special_numbers() {
        bool ok = true;
        ok &= require_(*value::read_value("12N")->as_int() == 12, "N suffix within int64 reads as an int");
        ok &= expect_edn_("1.5M", "1.5M");
        ok &= expect_edn_("1/3", "1/3");
        ok &= expect_edn_("99999999999999999999", "99999999999999999999");
        ok &= expect_edn_("-9223372036854775808", "-9223372036854775808");
        ok &= expect_edn_("##Inf", "##Inf");
        ok &= expect_edn_("##-Inf", "##-Inf");
        ok &= expect_edn_("2.0", "2.0");
        ok &= expect_edn_("0.1", "0.1");

        const auto nan = value::read_value("##NaN");
        ok &= require_(nan && nan->is_float() && std::isnan(std::get<double>(nan->data)), "##NaN");
        ok &= require_(value::read_value("1/3")->is_number(), "ratio is a number");
        return ok;
    }

    static bool test_characters() {
        bool ok = true;
        ok &= expect_edn_("\\a", "\\a");
        ok &= expect_edn_("\\newline", "\\newline");
        ok &= expect_edn_("\\space", "\\space");
        ok &= expect_edn_("\\u0041", "\\A");
        ok &= expect_edn_("\\o101", "\\A");
        ok &= require_(!value::read_value("\\bogus").has_value(), "unknown named character must not decode");
        return ok;
    }

    static bool test_collections_print_in_order() {
        bool ok = true;
        ok &= expect_edn_("[1 \"two\" :three]", "[1 \"two\" :three]");
        ok &= expect_edn_("(a , b)", "(a b)");
        ok &= expect_edn_("{:b 1 :a 2}", "{:b 1, :a 2}");
        ok &= expect_edn_("#{3 1 2}", "#{3 1 2}");
        ok &= expect_edn_("{:a #_ :gone [1 #_ 2 3]}", "{:a [1 3]}");
        ok &= expect_edn_("{:a ; c\n 1}", "{:a 1}");
        ok &= expect_edn_("#\"\\d+\"", "#\"\\d+\"");
        return ok;
    }

    static bool test_reader_macros() {
        bool ok = true;
        ok &= expect_edn_("'x", "(quote x)");
        ok &= expect_edn_("@a", "(clojure.core/deref a)");
        ok &= expect_edn_("#'f", "(var f)");
        ok &= expect_edn_("^{:doc \"d\"} [1]", "[1]");
        ok &= expect_edn_("^:private sym", "sym");
        ok &= expect_edn_("#inst \"2016-01-01\"", "#inst \"2016-01-01\"");
        ok &= expect_edn_("#:user{:id 7 :_/raw 1 :other/x 2}", "{:user/id 7, :raw 1, :other/x 2}");
        ok &= require_(!value::read_value("`(a ~b)").has_value(), "syntax-quote is not data");
        ok &= require_(!value::read_value("#(inc %)").has_value(), "anonymous fn is not data");
        ok &= require_(!value::read_value("#?(:clj 1)").has_value(), "reader conditional is not data");
        return ok;
    }

    static bool test_rejected_data() {
        bool ok = true;
        ok &= require_(!value::read_value("{:a 1 :b}").has_value(), "odd map must not decode");
        ok &= require_(!value::read_value("{:a 1 :a 2}").has_value(), "duplicate keys must not decode");
        ok &= require_(!value::read_value("#{1 1}").has_value(), "duplicate set items must not decode");
        ok &= require_(!value::read_value("\"bad \\q\"").has_value(), "bad escape must not decode");
        ok &= require_(!value::read_value("[1 2").has_value(), "reader errors give nothing");
        ok &= require_(!value::read_value(" ; nothing\n").has_value(), "no form gives nothing");
        ok &= require_(!value::read_value("[1 {:a}]").has_value(), "nested failure must propagate");
        return ok;
    }

    static bool test_equality() {
        const auto a = value::read_value("{:a [1 2] :b #{:x :y}}");
        const auto b = value::read_value("{:b #{:y :x} :a [1 2]}");
        const auto c = value::read_value("{:a (1 2) :b #{:x :y}}");
        bool ok = require_(a && b && c, "all three must decode");
        if (!ok) return false;
        ok &= require_(*a == *b, "maps and sets compare without order");
        ok &= require_(*a != *c, "vector and list are different values");
        ok &= require_(value::make_int(1) != *value::read_value("1.0"), "int and float differ");
        ok &= require_(*a->get(value::make_keyword("a")) == *value::read_value("[1 2]"), "get by key");
        ok &= require_(a->get(value::make_keyword("z")) == nullptr, "get of a missing key");
        return ok;
    }

    static bool test_type_names() {
        bool ok = true;
        ok &= require_(value::type_name(*value::read_value("{}")) == "map", "map");
        ok &= require_(value::type_name(*value::read_value("()")) == "list", "list");
        ok &= require_(value::type_name(*value::read_value("\"s\"")) == "string", "string");
        ok &= require_(value::type_name(*value::read_value("#inst \"x\"")) == "tagged", "tagged");
        return ok;
    }

    static bool test_parse_path_forms() {
        using ednpath::nav::KeySegment;
        ednpath::diag::Bag bag{};

        const auto vec = ednpath::nav::parse_path("[:cljsbuild :builds 0 \"s\" sym]", bag);
        bool ok = require_(vec.has_value(), "vector path must parse");
        if (vec) {
            ok &= require_(vec->size() == 5, "five segments");
            ok &= require_((*vec)[0] == KeySegment::keyword("cljsbuild"), "keyword segment");
            ok &= require_((*vec)[2] == KeySegment::at(0), "index segment");
            ok &= require_((*vec)[3] == KeySegment::string("s"), "string segment");
            ok &= require_((*vec)[4] == KeySegment::symbol("sym"), "symbol segment");
            ok &= require_(ednpath::nav::to_string(*vec) == "[:cljsbuild :builds 0 \"s\" sym]", "path prints back");
        }

        const auto bare = ednpath::nav::parse_path(" :a  1 ", bag);
        ok &= require_(bare && bare->size() == 2 && (*bare)[1] == KeySegment::at(1), "bare elements form a path");

        const auto nested = ednpath::nav::parse_path("[[0]]", bag);
        ok &= require_(!nested.has_value(), "a vector segment is not a key");
        ok &= require_(bag.has_code(ednpath::diag::Code::R_INVALID_PATH), "bad segments are reported");
        return ok;
    }

    static bool test_parse_path_rejects() {
        const std::vector<std::string> bad = {"", "[]", "[-1]", "[1.5]", "[:a", "{:a 1}", "[nil]"};
        bool ok = true;
        for (const auto& text : bad) {
            ednpath::diag::Bag bag{};
            const auto p = ednpath::nav::parse_path(text, bag);
            if (p.has_value() || !bag.has_code(ednpath::diag::Code::R_INVALID_PATH)) {
                std::cerr << "  - path should be rejected: '" << text << "'\n";
                ok = false;
            }
        }
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"scalars", test_scalars},
        {"big_and_special_numbers", test_big_and_special_numbers},
        {"characters", test_characters},
        {"collections_print_in_order", test_collections_print_in_order},
        {"reader_macros", test_reader_macros},
        {"rejected_data", test_rejected_data},
        {"equality", test_equality},
        {"type_names", test_type_names},
        {"parse_path_forms", test_parse_path_forms},
        {"parse_path_rejects", test_parse_path_rejects},
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
