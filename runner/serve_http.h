#pragma once

// HTTP/1.1 plumbing for cmd_serve: one request per connection, Connection: close.

#include <cstdint>
#include <sstream>
#include <string>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace cordon {

// Set socket recv/send timeouts for Slowloris defense
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

enum class ReadStatus { OK, CLOSED, TOO_LARGE, BAD_REQUEST };

// Reads head and body. Content-Length above max_body is rejected before the
// body is read.
inline ReadStatus read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    char buf[8192];
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return ReadStatus::CLOSED; // timeout or disconnect
        all.append(buf, (size_t)n);
        if (all.size() > 64 * 1024) return ReadStatus::TOO_LARGE; // header cap
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    int cl_count = 0;
    std::istringstream iss(head);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string low = line;
        for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        if (low.rfind("transfer-encoding:", 0) == 0) return ReadStatus::BAD_REQUEST;
        if (low.rfind("content-length:", 0) == 0) {
            if (++cl_count > 1) return ReadStatus::BAD_REQUEST; // request smuggling
            std::string v = line.substr(15);
            while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
            if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos || v.size() > 12) {
                return ReadStatus::BAD_REQUEST;
            }
            cl = (size_t)std::stoull(v);
        }
    }

    if (cl > max_body) return ReadStatus::TOO_LARGE;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return ReadStatus::CLOSED;
        body.append(buf, (size_t)n);
    }
    if (body.size() > cl) body.resize(cl);
    return ReadStatus::OK;
}

inline const char* http_reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 503: return "Service Unavailable";
        default: return "Error";
    }
}

inline void send_response(int fd, int code, const std::string& content_type, const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << http_reason(code) << "\r\n";
    oss << "Content-Type: " << content_type << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << body;
    auto s = oss.str();
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

inline void send_json(int fd, int code, const std::string& json) {
    send_response(fd, code, "application/json", json);
}

} // namespace cordon
