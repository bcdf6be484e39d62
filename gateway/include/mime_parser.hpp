#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <unordered_map>

namespace smsgw::gateway::mime {

struct HeaderField {
    std::string name;
    std::string value;
};

struct ContentType {
    std::string type = "text";
    std::string subtype = "plain";
    std::unordered_map<std::string, std::string> params;  // lower-case names

    std::string mime_type() const { return type + "/" + subtype; }
    std::optional<std::string> param(const std::string& name) const;

    // "text/html; charset=\"utf-8\"" -> {text, html, {charset: utf-8}}
    static ContentType parse(const std::string& value);
};

// Header block + body of a message or of one body part. Input is expected
// with LF line endings (see normalize_newlines).
struct Entity {
    std::vector<HeaderField> headers;
    std::string body;

    static Entity parse(std::string_view raw);

    std::optional<std::string> header(const std::string& name) const;
    ContentType content_type() const;
    std::string transfer_encoding() const;
    bool is_attachment() const;
};

std::string normalize_newlines(std::string_view text);

// Body parts between "--boundary" delimiter lines, or nullopt when the
// boundary never appears.
std::optional<std::vector<std::string>> split_multipart(std::string_view body,
                                                        const std::string& boundary);

std::string decode_quoted_printable(std::string_view encoded);
std::optional<std::string> decode_base64(std::string_view encoded);
std::string latin1_to_utf8(std::string_view text);
std::string cp1252_to_utf8(std::string_view text);

// Applies Content-Transfer-Encoding and charset conversion to entity.body;
// nullopt when the encoded payload is corrupt.
std::optional<std::string> decode_body(const Entity& entity);

}  // namespace smsgw::gateway::mime
