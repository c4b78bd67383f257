#include "persist/recon_config_file.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>

#include "core/normalizer.hpp"

namespace persist {
namespace {

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool expect(char c) noexcept { return consume(c); }

    std::optional<std::string> parse_string(std::string& err) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "Expected string";
            return std::nullopt;
        }
        ++pos_; // skip opening quote
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c == '\\') {
                if (pos_ >= src_.size()) {
                    err = "Invalid escape";
                    return std::nullopt;
                }
                const char esc = src_[pos_++];
                switch (esc) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    default:
                        err = "Unsupported escape sequence";
                        return std::nullopt;
                }
            } else {
                out.push_back(c);
            }
        }
        err = "Unterminated string";
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_uint64(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        if (start == pos_) {
            err = "Expected integer";
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (conv.ec != std::errc()) {
            err = "Invalid integer";
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_bool(std::string& err) noexcept {
        skip_ws();
        if (src_.substr(pos_).compare(0, 4, "true") == 0) {
            pos_ += 4;
            return true;
        }
        if (src_.substr(pos_).compare(0, 5, "false") == 0) {
            pos_ += 5;
            return false;
        }
        err = "Expected boolean";
        return std::nullopt;
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

private:
    mutable std::size_t pos_{0};
    std::string_view src_;
};

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!out.empty() && !in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace

std::optional<core::CombineSide> combine_side_from_string(std::string_view s) noexcept {
    std::string lower;
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "source") return core::CombineSide::Source;
    if (lower == "target") return core::CombineSide::Target;
    return std::nullopt;
}

bool parse_recon_config(std::string_view json, core::ReconConfig& out, std::string& error) noexcept {
    JsonCursor cur(json);
    if (!cur.expect('{')) {
        error = "Expected object";
        return false;
    }
    core::ReconConfig cfg = out;
    while (true) {
        cur.skip_ws();
        if (cur.consume('}')) {
            break;
        }
        std::string kerr;
        auto key = cur.parse_string(kerr);
        if (!key) { error = kerr; return false; }
        if (!cur.expect(':')) { error = "Expected ':'"; return false; }
        if (*key == "buyer_specific") {
            auto v = cur.parse_bool(kerr);
            if (!v) { error = kerr; return false; }
            cfg.buyer_specific = *v;
        } else if (*key == "combine_po_in") {
            auto v = cur.parse_string(kerr);
            if (!v) { error = kerr; return false; }
            auto side = combine_side_from_string(*v);
            if (!side) { error = "Unknown combine_po_in value: " + *v; return false; }
            cfg.combine_po_in = *side;
        } else if (*key == "flagged_buyers") {
            if (!cur.expect('[')) { error = "Expected flagged_buyers array"; return false; }
            cfg.flagged_buyers.clear();
            while (true) {
                cur.skip_ws();
                if (cur.consume(']')) break;
                auto sv = cur.parse_string(kerr);
                if (!sv) { error = kerr; return false; }
                std::string name = core::normalize_key_value(*sv);
                if (!name.empty()) {
                    cfg.flagged_buyers.insert(std::move(name));
                }
                cur.skip_ws();
                if (cur.consume(']')) break;
                if (!cur.consume(',')) { error = "Expected ','"; return false; }
            }
        } else if (*key == "progress_interval") {
            auto v = cur.parse_uint64(kerr);
            if (!v) { error = kerr; return false; }
            cfg.progress_interval = static_cast<std::size_t>(*v);
        } else {
            error = "Unknown field: " + *key;
            return false;
        }
        cur.skip_ws();
        if (cur.consume('}')) break;
        if (!cur.consume(',')) { error = "Expected ','"; return false; }
    }
    if (!cur.eof()) {
        error = "Trailing content after object";
        return false;
    }
    out = std::move(cfg);
    return true;
}

bool load_recon_config(const std::filesystem::path& path, core::ReconConfig& out, std::string& error) noexcept {
    std::string contents;
    if (!load_file(path, contents, error)) {
        return false;
    }
    if (!parse_recon_config(contents, out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

} // namespace persist
