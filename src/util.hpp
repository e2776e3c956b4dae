#pragma once

#include <string>

namespace stream_keeper {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path + query (e.g. "/2/tweets/search/stream?format=compact")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// RFC 3986 percent-encoding.  Everything except unreserved characters
/// (ALPHA / DIGIT / "-" / "." / "_" / "~") is escaped, including ! ' ( ) *.
std::string urlEncode(const std::string& value);

/// Standard base64 (with '=' padding).
std::string base64Encode(const std::string& value);

/// Replace each line break (CRLF, LF or CR), '@' and '#' with a single space.
/// Idempotent: sanitizeText(sanitizeText(s)) == sanitizeText(s).
std::string sanitizeText(const std::string& text);

/// Current UTC time as ISO-8601 with millisecond precision,
/// e.g. "2024-05-01T12:34:56.789Z".  Used to prefix lifecycle log lines.
std::string isoTimestamp();

} // namespace stream_keeper
