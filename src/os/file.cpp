#include <ednpath/os/File.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>

namespace ednpath::os {

namespace {

struct FileCloser {
    void operator()(std::FILE* fp) const {
        if (fp) std::fclose(fp);
    }
};

} // namespace

ReadTextResult read_text_file(std::string_view path) {
    ReadTextResult r{};

    if (!is_regular_file(path)) {
        r.missing = true;
        r.err = "no such file";
        return r;
    }

    std::FILE* raw = std::fopen(std::string(path).c_str(), "rb");
    if (!raw) {
        r.err = std::string("cannot open file: ") + std::strerror(errno);
        return r;
    }
    // closed before the caller ever parses the text
    std::unique_ptr<std::FILE, FileCloser> fp(raw);

    if (std::fseek(fp.get(), 0, SEEK_END) != 0) {
        r.err = "cannot seek file";
        return r;
    }
    const long sz = std::ftell(fp.get());
    if (sz < 0 || std::fseek(fp.get(), 0, SEEK_SET) != 0) {
        r.err = "cannot read file size";
        return r;
    }

    r.text.resize(static_cast<std::size_t>(sz));
    const std::size_t n = std::fread(r.text.data(), 1, r.text.size(), fp.get());
    if (n != r.text.size()) {
        r.text.clear();
        r.err = "short read";
        return r;
    }

    r.ok = true;
    return r;
}

bool is_regular_file(std::string_view path) {
    std::error_code ec{};
    return std::filesystem::is_regular_file(std::filesystem::path(path), ec) && !ec;
}

std::string normalize_path(std::string_view path) {
    namespace fs = std::filesystem;
    std::error_code ec{};
    const fs::path p(path);
    const fs::path c = fs::weakly_canonical(p, ec);
    if (!ec) return c.string();
    return p.lexically_normal().string();
}

} // namespace ednpath::os
