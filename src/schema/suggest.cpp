#include <ednpath/schema/Suggest.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace ednpath::schema {

namespace {

constexpr size_t kMaxDistance = 2;

std::string fold(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (c == '-' || c == '_' || c == '.') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

size_t edit_distance(std::string_view a, std::string_view b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    // two rolling rows of the DP matrix
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[b.size()];
}

std::optional<std::string> suggest_key(std::string_view name, const KeyTable& table) {
    const KeySpec* best = nullptr;
    size_t best_d = kMaxDistance + 1;
    for (const auto& e : table.entries()) {
        const size_t d = edit_distance(name, e.name);
        if (d < best_d) {
            best = &e;
            best_d = d;
        }
    }
    if (best && best_d <= kMaxDistance) return best->name;

    const std::string folded = fold(name);
    const KeySpec* only = nullptr;
    for (const auto& e : table.entries()) {
        if (fold(e.name) != folded) continue;
        if (only) return std::nullopt;
        only = &e;
    }
    if (only) return only->name;
    return std::nullopt;
}

} // namespace ednpath::schema
