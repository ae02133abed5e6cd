#pragma once

// HTTP/1.1 helpers for cmd_serve: one request per connection, Connection: close.

#ifndef _WIN32

#include "modpack/download.h"
#include "modpack/manifest.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <sstream>
#include <utility>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace modpack {

// Set socket recv/send timeouts for Slowloris defense
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

inline std::string lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

inline std::string header_value_ci(const std::string& head, const std::string& key_lower) {
    std::istringstream iss(head);
    std::string line;
    std::getline(iss, line); // request line
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto c = line.find(':');
        if (c == std::string::npos) continue;
        if (lower_ascii(line.substr(0, c)) == key_lower) {
            std::string v = line.substr(c + 1);
            while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
            while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
            return v;
        }
    }
    return "";
}

enum class ReadStatus { OK, TOO_LARGE, BAD };

// max_body: Content-Length above this is answered without reading the body.
inline ReadStatus read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(16384);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return ReadStatus::BAD; // timeout or disconnect
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024 && all.find("\r\n\r\n") == std::string::npos) return ReadStatus::BAD;
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    {
        int cl_count = 0;
        std::istringstream iss(head);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string low = lower_ascii(line);
            if (low.rfind("transfer-encoding:", 0) == 0) return ReadStatus::BAD; // chunked uploads unsupported
            if (low.rfind("content-length:", 0) == 0) {
                cl_count++;
                if (cl_count > 1) return ReadStatus::BAD; // duplicate Content-Length: request smuggling
                std::string v = line.substr(15);
                while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
                try { cl = (size_t)std::stoull(v); } catch (const std::exception&) { return ReadStatus::BAD; }
            }
        }
    }

    if (cl > max_body) return ReadStatus::TOO_LARGE;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return ReadStatus::BAD;
        body.append(buf.data(), (size_t)n);
    }
    if (body.size() > cl) body.resize(cl);
    return ReadStatus::OK;
}

struct RequestLine {
    std::string method;
    std::string path;  // without query string
    std::string query;
};

inline RequestLine parse_request_line(const std::string& head) {
    RequestLine rl;
    std::istringstream iss(head);
    std::string target, ver;
    iss >> rl.method >> target >> ver;
    auto q = target.find('?');
    if (q != std::string::npos) {
        rl.query = target.substr(q + 1);
        target.resize(q);
    }
    rl.path = target;
    return rl;
}

inline const char* reason_phrase(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "ERR";
}

inline bool send_all(int fd, const char* data, size_t n) {
    size_t sent = 0;
    while (sent < n) {
        ssize_t w = ::send(fd, data + sent, n - sent, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        sent += (size_t)w;
    }
    return true;
}

inline bool send_response(int fd, int code, const std::string& content_type, const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << reason_phrase(code) << "\r\n";
    oss << "Content-Type: " << content_type << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Cache-Control: no-store\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << body;
    auto s = oss.str();
    return send_all(fd, s.data(), s.size());
}

inline bool send_text(int fd, int code, const std::string& text) {
    return send_response(fd, code, "text/plain; charset=utf-8", text);
}

inline bool send_html(int fd, int code, const std::string& html) {
    return send_response(fd, code, "text/html;charset=utf-8", html);
}

inline bool send_json(int fd, int code, const std::string& json) {
    return send_response(fd, code, "application/json", json);
}

// Headers with a declared length, then the file in chunks. Returns false when
// the client went away or the read failed; either way the caller just closes.
inline bool send_artifact(int fd, ArtifactFile& file) {
    std::ostringstream oss;
    oss << "HTTP/1.1 200 OK\r\n";
    oss << "Content-Type: " << kArchiveContentType << "\r\n";
    oss << "Content-Length: " << file.size() << "\r\n";
    oss << "Content-Disposition: attachment; filename=\"" << kAttachmentName << "\"\r\n";
    oss << "Cache-Control: no-store\r\n";
    oss << "Connection: close\r\n\r\n";
    auto h = oss.str();
    if (!send_all(fd, h.data(), h.size())) return false;

    std::vector<char> buf(64 * 1024);
    uint64_t left = file.size();
    while (left > 0) {
        ssize_t n = file.read(buf.data(), buf.size());
        if (n <= 0) return false;
        size_t take = (size_t)std::min<uint64_t>((uint64_t)n, left);
        if (!send_all(fd, buf.data(), take)) return false;
        left -= take;
    }
    return true;
}

// ---- form bodies ----

inline std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    auto hexv = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '+') { out.push_back(' '); continue; }
        if (c == '%' && i + 2 < s.size()) {
            int hi = hexv(s[i + 1]), lo = hexv(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back((char)(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

struct FormPart {
    std::string name;
    bool is_file{false}; // a filename= attribute was present
    std::string filename;
    std::string data;
};

// Value of attr inside a header like `form-data; name="x"; filename="y"`.
inline bool header_param(const std::string& header, const std::string& attr, std::string& out) {
    std::string low = lower_ascii(header);
    size_t pos = 0;
    while ((pos = low.find(attr + "=", pos)) != std::string::npos) {
        bool at_boundary = (pos == 0 || low[pos - 1] == ';' || low[pos - 1] == ' ' || low[pos - 1] == '\t');
        if (!at_boundary) { pos += attr.size(); continue; }
        size_t v = pos + attr.size() + 1;
        if (v < header.size() && header[v] == '"') {
            size_t end = header.find('"', v + 1);
            if (end == std::string::npos) return false;
            out = header.substr(v + 1, end - v - 1);
        } else {
            size_t end = header.find(';', v);
            out = header.substr(v, end == std::string::npos ? std::string::npos : end - v);
            while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) out.pop_back();
        }
        return true;
    }
    return false;
}

// RFC 7578 multipart/form-data. Returns false on framing errors.
inline bool parse_multipart(const std::string& body, const std::string& boundary, std::vector<FormPart>& parts) {
    parts.clear();
    if (boundary.empty()) return false;
    const std::string delim = "--" + boundary;

    size_t pos = body.find(delim);
    if (pos == std::string::npos) return false;
    pos += delim.size();

    while (true) {
        if (body.compare(pos, 2, "--") == 0) return true; // closing delimiter
        if (body.compare(pos, 2, "\r\n") != 0) return false;
        pos += 2;

        size_t hend = body.find("\r\n\r\n", pos);
        if (hend == std::string::npos) return false;
        std::string headers = body.substr(pos, hend - pos);
        size_t dstart = hend + 4;

        size_t next = body.find("\r\n" + delim, dstart);
        if (next == std::string::npos) return false;

        FormPart part;
        std::istringstream hs(headers);
        std::string line;
        while (std::getline(hs, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            auto c = line.find(':');
            if (c == std::string::npos) continue;
            if (lower_ascii(line.substr(0, c)) != "content-disposition") continue;
            std::string v = line.substr(c + 1);
            (void)header_param(v, "name", part.name);
            part.is_file = header_param(v, "filename", part.filename);
        }
        part.data = body.substr(dstart, next - dstart);
        parts.push_back(std::move(part));
        pos = next + 2 + delim.size();
    }
}

inline std::vector<std::pair<std::string, std::string>> parse_urlencoded(const std::string& body) {
    std::vector<std::pair<std::string, std::string>> out;
    size_t start = 0;
    while (start <= body.size()) {
        size_t amp = body.find('&', start);
        std::string kv = body.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!kv.empty()) {
            size_t eq = kv.find('=');
            if (eq == std::string::npos) out.push_back({url_decode(kv), ""});
            else out.push_back({url_decode(kv.substr(0, eq)), url_decode(kv.substr(eq + 1))});
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return out;
}

// Map an /upload body onto the two manifest sources. Form field names:
// packageFile (file) and packageText (pasted). A raw JSON body counts as the
// file payload. Returns false if the body is not a well-formed form.
inline bool extract_manifest_input(const std::string& head, const std::string& body, ManifestInput& in) {
    in = ManifestInput{};
    const std::string ctype = header_value_ci(head, "content-type");
    const std::string ctype_low = lower_ascii(ctype);

    if (ctype_low.rfind("multipart/form-data", 0) == 0) {
        std::string boundary;
        if (!header_param(ctype, "boundary", boundary)) return false;
        std::vector<FormPart> parts;
        if (!parse_multipart(body, boundary, parts)) return false;
        for (auto& p : parts) {
            if (p.name == "packageText") {
                in.pasted_text = std::move(p.data);
            } else if (p.name == "packageFile") {
                in.has_file = !(p.filename.empty() && p.data.empty());
                in.file_content = std::move(p.data);
            }
        }
        return true;
    }
    if (ctype_low.rfind("application/x-www-form-urlencoded", 0) == 0) {
        for (auto& kv : parse_urlencoded(body)) {
            if (kv.first == "packageText") in.pasted_text = kv.second;
        }
        return true;
    }
    in.has_file = !body.empty();
    in.file_content = body;
    return true;
}

} // namespace modpack

#endif // !_WIN32
