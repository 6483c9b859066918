#include "static_server.hpp"

#include <print>

namespace {

void method_not_allowed(const httplib::Request&, httplib::Response& res) {
    res.status = 405;
    res.set_content("405 Method Not Allowed\n", "text/plain");
}

} // namespace

StaticFileServer::StaticFileServer(std::string root, bool verbose)
    : root_(std::move(root)), verbose_(verbose) {
    svr_.set_file_extension_and_mimetype_mapping("html", "text/html; charset=utf-8");
    svr_.set_keep_alive_max_count(1);

    svr_.Post(".*", method_not_allowed);
    svr_.Put(".*", method_not_allowed);
    svr_.Patch(".*", method_not_allowed);
    svr_.Delete(".*", method_not_allowed);

    svr_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        log(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

StaticFileServer::~StaticFileServer() {
    stop();
}

bool StaticFileServer::start(const std::string& host, uint16_t port) {
    // "/static/..." and "/..." map onto the same tree; "/" serves index.html.
    if (!svr_.set_mount_point("/static", root_) || !svr_.set_mount_point("/", root_)) {
        std::println(stderr, "http: web root {} not found, serving nothing", root_);
    }

    if (port == 0) {
        int bound = svr_.bind_to_any_port(host);
        if (bound < 0) {
            std::println(stderr, "http: cannot listen on {}:0", host);
            return false;
        }
        port_ = static_cast<uint16_t>(bound);
    } else {
        if (!svr_.bind_to_port(host, port)) {
            std::println(stderr, "http: cannot listen on {}:{}", host, port);
            return false;
        }
        port_ = port;
    }

    thread_ = std::jthread([this] {
        if (!svr_.listen_after_bind()) {
            std::println(stderr, "http: server on port {} stopped with an error", port_);
        }
    });
    // stop() is a no-op until the accept loop is running.
    svr_.wait_until_ready();

    log("HTTP server on " + host + ":" + std::to_string(port_) + " serving " + root_);
    return true;
}

void StaticFileServer::stop() {
    if (!thread_.joinable()) return;
    svr_.stop();
    thread_.join();
}

void StaticFileServer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ask-anywhere-server] {}", msg);
    }
}
