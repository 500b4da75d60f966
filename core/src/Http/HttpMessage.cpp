#include "streamvault/Http/HttpMessage.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace StreamVault {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

bool isTokenChar(char c) {
    // RFC 7230 tchar
    static const std::string extra = "!#$%&'*+-.^_`|~";
    return std::isalnum(static_cast<unsigned char>(c)) || extra.find(c) != std::string::npos;
}

bool hasControlChars(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return (u < 0x20 && c != '\t') || u == 0x7f;
    });
}

std::optional<std::string> findHeader(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// HttpRequest
// ═══════════════════════════════════════════════════════════

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    return findHeader(headers, name);
}

std::optional<HttpRequest> HttpRequest::parse(const std::string& raw) {
    size_t headEnd = findHeadEnd(raw);
    if (headEnd == std::string::npos || headEnd > MAX_REQUEST_HEAD_SIZE) {
        return std::nullopt;
    }

    HttpRequest request;
    size_t lineStart = 0;
    bool first = true;

    while (lineStart < headEnd) {
        size_t lineEnd = raw.find("\r\n", lineStart);
        if (lineEnd == std::string::npos || lineEnd > headEnd) {
            return std::nullopt;
        }
        std::string line = raw.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 2;

        if (line.empty()) {
            break;
        }

        if (first) {
            first = false;
            // METHOD SP TARGET SP VERSION
            size_t sp1 = line.find(' ');
            size_t sp2 = line.rfind(' ');
            if (sp1 == std::string::npos || sp2 == sp1) {
                return std::nullopt;
            }
            request.method = line.substr(0, sp1);
            request.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
            request.version = line.substr(sp2 + 1);

            if (request.method.empty() ||
                !std::all_of(request.method.begin(), request.method.end(), isTokenChar)) {
                return std::nullopt;
            }
            if (request.target.empty() || request.target.front() != '/' ||
                request.target.find(' ') != std::string::npos || hasControlChars(request.target)) {
                return std::nullopt;
            }
            if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0") {
                return std::nullopt;
            }

            size_t q = request.target.find('?');
            request.path = request.target.substr(0, q);
            if (q != std::string::npos) {
                request.query = request.target.substr(q + 1);
            }
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        std::string name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), isTokenChar)) {
            return std::nullopt;
        }
        std::string value = trim(line.substr(colon + 1));
        if (hasControlChars(value)) {
            return std::nullopt;
        }
        request.headers.emplace_back(std::move(name), std::move(value));
    }

    if (first) {
        return std::nullopt;
    }
    return request;
}

size_t findHeadEnd(const std::string& buffer) {
    size_t pos = buffer.find("\r\n\r\n");
    return pos == std::string::npos ? std::string::npos : pos + 4;
}

// ═══════════════════════════════════════════════════════════
// HttpResponseHead
// ═══════════════════════════════════════════════════════════

void HttpResponseHead::set(const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers) {
        if (equalsIgnoreCase(key, name)) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::optional<std::string> HttpResponseHead::get(const std::string& name) const {
    return findHeader(headers, name);
}

std::string HttpResponseHead::serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << ' ' << statusText(status) << "\r\n";
    for (const auto& [key, value] : headers) {
        oss << key << ": " << value << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 416: return "Range Not Satisfiable";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// JSON responses
// ═══════════════════════════════════════════════════════════

nlohmann::json errorBody(const std::string& error,
                         const std::string& details,
                         const std::optional<std::string>& hint,
                         std::optional<int64_t> retryAfterSeconds) {
    nlohmann::json body = {
        {"error", error},
        {"details", details}
    };
    if (hint) {
        body["hint"] = *hint;
    }
    if (retryAfterSeconds) {
        body["retry_after"] = *retryAfterSeconds;
    }
    return body;
}

bool sendJson(ResponseSink& sink, int status, const nlohmann::json& body,
              const HttpHeaders& extraHeaders, bool headOnly) {
    std::string payload = body.dump();

    HttpResponseHead head;
    head.status = status;
    head.set("Content-Type", "application/json");
    head.set("Content-Length", std::to_string(payload.size()));
    for (const auto& [key, value] : extraHeaders) {
        head.set(key, value);
    }

    if (!sink.sendHead(head)) {
        return false;
    }
    if (headOnly) {
        return true;
    }
    return sink.sendBody(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

} // namespace StreamVault
