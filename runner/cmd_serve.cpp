#include "cmd_serve.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "cordon/dispatcher.h"
#include "cordon/http_api.h"
#include "cordon/log.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>

using namespace cordon;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

void handle_connection(Dispatcher& d, int cfd) {
    std::string head, body;
    ReadStatus rs = read_http_request(cfd, head, body, kMaxHttpBodyBytes);
    if (rs == ReadStatus::TOO_LARGE) {
        send_json(cfd, 413, "{\"ok\":false,\"error\":\"request too large\"}");
        return;
    }
    if (rs == ReadStatus::BAD_REQUEST) {
        send_json(cfd, 400, "{\"ok\":false,\"error\":\"bad request\"}");
        return;
    }
    if (rs != ReadStatus::OK) return;

    std::istringstream iss(head);
    std::string method, path, ver;
    iss >> method >> path >> ver;
    size_t qm = path.find('?');
    if (qm != std::string::npos) path.resize(qm);

    HttpResponse r = route_request(d, method, path, body);
    send_response(cfd, r.code, r.content_type, r.body);
}

} // namespace

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: writing to disconnected clients should not crash the server
    ::signal(SIGPIPE, SIG_IGN);

    std::string host = "127.0.0.1";
    int port = 8080;
    int workers = 0;
    int max_conns = 64;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        bool ok = true;
        if (a == "--host" && i + 1 < argc) { host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { ok = parse_int_arg(argv[++i], &port) && port > 0 && port < 65536; }
        else if (a == "--workers" && i + 1 < argc) { ok = parse_int_arg(argv[++i], &workers) && workers >= 1 && workers <= 64; }
        else if (a == "--max_conns" && i + 1 < argc) { ok = parse_int_arg(argv[++i], &max_conns) && max_conns >= 1; }
        else ok = false;
        if (!ok) {
            std::cerr << "usage: cordon_cli serve [--host <ip>] [--port <n>] [--workers <n>] [--max_conns <n>]\n";
            return 2;
        }
    }

    EngineConfig cfg = load_engine_config(argv[0]);
    if (workers > 0) cfg.workers = workers;

    // Create the server socket BEFORE starting workers so a bind failure
    // leaves nothing running.
    int sfd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return 2;
    }

    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);

    Dispatcher dispatcher(cfg);
    std::atomic<int> active_conns{0};

    log_line(LogLevel::INFO, "serve", "http://" + host + ":" + std::to_string(port) +
             " workers=" + std::to_string(cfg.workers));

    while (!g_stop.load()) {
        pollfd pfd{sfd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 200);
        if (pr <= 0) continue;

        sockaddr_in caddr{}; socklen_t clen = sizeof(caddr);
        int cfd = ::accept4(sfd, (sockaddr*)&caddr, &clen, SOCK_CLOEXEC);
        if (cfd < 0) continue;
        if (active_conns.load() >= max_conns) {
            send_json(cfd, 503, "{\"ok\":false,\"error\":\"too many connections\"}");
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10);

        std::thread([&dispatcher, &active_conns, cfd]() {
            struct ConnGuard {
                std::atomic<int>& c;
                int fd;
                ~ConnGuard() { ::close(fd); c.fetch_sub(1); }
            } cg{active_conns, cfd};
            handle_connection(dispatcher, cfd);
        }).detach();
    }

    log_line(LogLevel::INFO, "serve", "shutting down");
    ::close(sfd);
    // Connection threads reference the dispatcher; wait for them first.
    while (active_conns.load() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    dispatcher.shutdown();
    return 0;
}
