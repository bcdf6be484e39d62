#include "mime_parser.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>

namespace smsgw::gateway::mime {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

// field-name = 1*(printable US-ASCII except ':'), RFC 5322 section 3.6.8
bool is_header_line(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    return std::all_of(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(colon),
                       [](unsigned char c) { return c > 32 && c < 127; });
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}  // namespace

std::optional<std::string> ContentType::param(const std::string& name) const {
    auto it = params.find(to_lower(name));
    if (it != params.end()) {
        return it->second;
    }
    return std::nullopt;
}

ContentType ContentType::parse(const std::string& value) {
    ContentType ct;

    auto semi = value.find(';');
    std::string media = to_lower(trim(value.substr(0, semi)));
    auto slash = media.find('/');
    if (slash != std::string::npos && slash > 0 && slash + 1 < media.size()) {
        ct.type = trim(media.substr(0, slash));
        ct.subtype = trim(media.substr(slash + 1));
    }

    // name=value pairs; values may be quoted and contain ';'
    size_t pos = semi;
    while (pos != std::string::npos && pos < value.size()) {
        ++pos;
        auto eq = value.find('=', pos);
        if (eq == std::string::npos) break;

        std::string name = to_lower(trim(value.substr(pos, eq - pos)));
        size_t cursor = eq + 1;
        while (cursor < value.size() && (value[cursor] == ' ' || value[cursor] == '\t')) {
            ++cursor;
        }

        std::string param_value;
        if (cursor < value.size() && value[cursor] == '"') {
            ++cursor;
            while (cursor < value.size() && value[cursor] != '"') {
                if (value[cursor] == '\\' && cursor + 1 < value.size()) {
                    ++cursor;
                }
                param_value += value[cursor++];
            }
            pos = value.find(';', cursor);
        } else {
            pos = value.find(';', cursor);
            param_value = trim(value.substr(cursor, pos == std::string::npos ? std::string::npos : pos - cursor));
        }

        if (!name.empty()) {
            ct.params[name] = param_value;
        }
    }

    return ct;
}

Entity Entity::parse(std::string_view raw) {
    Entity entity;
    size_t pos = 0;

    while (pos < raw.size()) {
        size_t eol = raw.find('\n', pos);
        std::string_view line = raw.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);

        if (line.empty()) {
            // Blank line separates headers from body
            pos = (eol == std::string_view::npos) ? raw.size() : eol + 1;
            break;
        }

        if ((line[0] == ' ' || line[0] == '\t') && !entity.headers.empty()) {
            // Folded continuation line
            entity.headers.back().value += " " + trim(line);
        } else if (is_header_line(line)) {
            auto colon = line.find(':');
            entity.headers.push_back({std::string(line.substr(0, colon)), trim(line.substr(colon + 1))});
        } else {
            // Not a header: the body starts here without a separator line
            break;
        }

        pos = (eol == std::string_view::npos) ? raw.size() : eol + 1;
    }

    entity.body = std::string(raw.substr(std::min(pos, raw.size())));
    return entity;
}

std::optional<std::string> Entity::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& field : headers) {
        if (to_lower(field.name) == wanted) {
            return field.value;
        }
    }
    return std::nullopt;
}

ContentType Entity::content_type() const {
    auto value = header("Content-Type");
    if (!value) {
        return ContentType{};
    }
    return ContentType::parse(*value);
}

std::string Entity::transfer_encoding() const {
    auto value = header("Content-Transfer-Encoding");
    return value ? to_lower(trim(*value)) : "7bit";
}

bool Entity::is_attachment() const {
    auto value = header("Content-Disposition");
    if (!value) return false;
    return to_lower(trim(value->substr(0, value->find(';')))) == "attachment";
}

std::string normalize_newlines(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}

std::optional<std::vector<std::string>> split_multipart(std::string_view body,
                                                        const std::string& boundary) {
    const std::string delimiter = "--" + boundary;
    const std::string close_delimiter = delimiter + "--";

    std::vector<std::string> parts;
    std::string current;
    bool seen_delimiter = false;
    bool in_part = false;

    size_t pos = 0;
    while (pos <= body.size()) {
        size_t eol = body.find('\n', pos);
        std::string_view line = body.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);

        // Transport padding after a delimiter is allowed
        auto end = line.find_last_not_of(" \t");
        std::string_view bare = end == std::string_view::npos ? std::string_view{} : line.substr(0, end + 1);

        if (bare == close_delimiter) {
            if (in_part) parts.push_back(current);
            seen_delimiter = true;
            in_part = false;
            break;
        }
        if (bare == delimiter) {
            if (in_part) parts.push_back(current);
            current.clear();
            seen_delimiter = true;
            in_part = true;
        } else if (in_part) {
            current.append(line);
            current += '\n';
        }

        if (eol == std::string_view::npos) break;
        pos = eol + 1;
    }

    if (!seen_delimiter) {
        return std::nullopt;
    }
    if (in_part) {
        // Missing close delimiter; keep what arrived
        parts.push_back(current);
    }

    // The line break before a delimiter belongs to the delimiter
    for (auto& part : parts) {
        if (!part.empty() && part.back() == '\n') {
            part.pop_back();
        }
    }
    return parts;
}

std::string decode_quoted_printable(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size());

    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c != '=') {
            out += c;
            continue;
        }

        // Soft line break, possibly with trailing whitespace before it
        size_t j = i + 1;
        while (j < encoded.size() && (encoded[j] == ' ' || encoded[j] == '\t')) {
            ++j;
        }
        if (j < encoded.size() && encoded[j] == '\n') {
            i = j;
            continue;
        }
        if (j == encoded.size()) {
            break;
        }

        if (i + 2 < encoded.size()) {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += c;  // Malformed escape is kept literally
    }

    return out;
}

std::optional<std::string> decode_base64(std::string_view encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) continue;
        if (!std::isalnum(uc) && c != '+' && c != '/' && c != '=') {
            return std::nullopt;
        }
        compact += c;
    }
    if (compact.empty()) {
        return std::string{};
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    BIO* bio = BIO_new_mem_buf(compact.data(), static_cast<int>(compact.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string decoded;
    std::vector<char> chunk(4096);
    int len = 0;
    while ((len = BIO_read(bio, chunk.data(), static_cast<int>(chunk.size()))) > 0) {
        decoded.append(chunk.data(), static_cast<size_t>(len));
    }
    BIO_free_all(bio);

    return decoded;
}

std::string latin1_to_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) {
            out += c;
        } else {
            out += static_cast<char>(0xC0 | (uc >> 6));
            out += static_cast<char>(0x80 | (uc & 0x3F));
        }
    }
    return out;
}

namespace {

// Windows-1252 code points for 0x80-0x9F; zero marks the five unassigned
// bytes, which map to the C1 control of the same value
constexpr char16_t kCp1252High[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}  // namespace

std::string cp1252_to_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        char32_t cp = uc;
        if (uc >= 0x80 && uc <= 0x9F && kCp1252High[uc - 0x80] != 0) {
            cp = kCp1252High[uc - 0x80];
        }
        append_utf8(out, cp);
    }
    return out;
}

std::optional<std::string> decode_body(const Entity& entity) {
    std::string encoding = entity.transfer_encoding();
    std::string text;

    if (encoding == "quoted-printable") {
        text = decode_quoted_printable(entity.body);
    } else if (encoding == "base64") {
        auto decoded = decode_base64(entity.body);
        if (!decoded) {
            return std::nullopt;
        }
        text = normalize_newlines(*decoded);
    } else {
        if (encoding != "7bit" && encoding != "8bit" && encoding != "binary") {
            LOG_DEBUG_FMT("Unknown Content-Transfer-Encoding '{}', using body as-is", encoding);
        }
        text = entity.body;
    }

    std::string charset = to_lower(entity.content_type().param("charset").value_or("us-ascii"));
    if (charset == "iso-8859-1" || charset == "latin1" || charset == "latin-1" ||
        charset == "iso_8859-1") {
        text = latin1_to_utf8(text);
    } else if (charset == "windows-1252" || charset == "cp1252") {
        text = cp1252_to_utf8(text);
    } else if (charset != "utf-8" && charset != "utf8" && charset != "us-ascii") {
        LOG_DEBUG_FMT("Charset '{}' passed through unconverted", charset);
    }

    return text;
}

}  // namespace smsgw::gateway::mime
