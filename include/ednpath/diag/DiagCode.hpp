#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ednpath::diag {

enum class Code : uint16_t {
    C_INVALID_TOKEN = 1,
    C_UNTERMINATED_STRING,
    C_UNBALANCED_DELIMITER,
    C_UNEXPECTED_EOF,
    C_EXPECTED_FORM,
    C_NESTING_TOO_DEEP,

    R_FILE_NOT_FOUND = 100,
    R_FILE_READ_FAILED,
    R_INVALID_PATH,
    R_PATH_NOT_FOUND,
    R_NO_INITIAL_FORM,

    S_NOT_A_MAP = 200,
    S_UNKNOWN_KEY,
    S_INVALID_VALUE,
    S_MISSING_KEY,
};

inline const char* code_name(Code c) {
    switch (c) {
        case Code::C_INVALID_TOKEN: return "C_INVALID_TOKEN";
        case Code::C_UNTERMINATED_STRING: return "C_UNTERMINATED_STRING";
        case Code::C_UNBALANCED_DELIMITER: return "C_UNBALANCED_DELIMITER";
        case Code::C_UNEXPECTED_EOF: return "C_UNEXPECTED_EOF";
        case Code::C_EXPECTED_FORM: return "C_EXPECTED_FORM";
        case Code::C_NESTING_TOO_DEEP: return "C_NESTING_TOO_DEEP";
        case Code::R_FILE_NOT_FOUND: return "R_FILE_NOT_FOUND";
        case Code::R_FILE_READ_FAILED: return "R_FILE_READ_FAILED";
        case Code::R_INVALID_PATH: return "R_INVALID_PATH";
        case Code::R_PATH_NOT_FOUND: return "R_PATH_NOT_FOUND";
        case Code::R_NO_INITIAL_FORM: return "R_NO_INITIAL_FORM";
        case Code::S_NOT_A_MAP: return "S_NOT_A_MAP";
        case Code::S_UNKNOWN_KEY: return "S_UNKNOWN_KEY";
        case Code::S_INVALID_VALUE: return "S_INVALID_VALUE";
        case Code::S_MISSING_KEY: return "S_MISSING_KEY";
    }
    return "UNKNOWN";
}

// line == 0 means the location is unknown; `path` then carries the logical
// path into the document instead.
struct Diagnostic {
    Code code{};
    std::string file;
    uint32_t line = 1;
    uint32_t column = 1;
    std::string message;
    std::string path{};
    std::string note{};

    bool has_location() const { return line != 0; }
};

class Bag {
public:
    void add(Code code, std::string file, uint32_t line, uint32_t column, std::string message) {
        diagnostics_.push_back(Diagnostic{code, std::move(file), line, column, std::move(message), {}, {}});
    }

    void add(Diagnostic d) { diagnostics_.push_back(std::move(d)); }

    bool has_error() const { return !diagnostics_.empty(); }

    bool has_code(Code code) const {
        for (const auto& d : diagnostics_) {
            if (d.code == code) return true;
        }
        return false;
    }

    size_t size() const { return diagnostics_.size(); }

    const std::vector<Diagnostic>& all() const { return diagnostics_; }

    std::string render_text() const {
        std::ostringstream oss;
        for (const auto& d : diagnostics_) {
            oss << "error[" << code_name(d.code) << "]: " << d.message << "\n";
            if (d.has_location()) {
                oss << " --> " << d.file << ":" << d.line << ":" << d.column << "\n";
            } else if (!d.path.empty()) {
                oss << " --> " << d.file << " (path " << d.path << ")\n";
            } else {
                oss << " --> " << d.file << "\n";
            }
            if (!d.note.empty()) oss << "  = " << d.note << "\n";
        }
        return oss.str();
    }

private:
    std::vector<Diagnostic> diagnostics_{};
};

} // namespace ednpath::diag
