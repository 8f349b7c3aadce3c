#include "http_server.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace {

std::optional<std::string> query_param(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) {
        return std::nullopt;
    }
    return req.get_param_value(name);
}

} // namespace

HttpServer::HttpServer(const Config& config, HubApi& api, IngressMeter& meter)
    : config_(config), api_(api), meter_(meter), running_(false) {
    server_ = std::make_unique<httplib::Server>();
    int threads = config.http_threads;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}", config_.listen_addr, config_.listen_port);
        }
        running_ = false;
    });
}

void HttpServer::stop() {
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    running_ = false;
}

bool HttpServer::is_running() const {
    return running_;
}

httplib::Server::Handler HttpServer::wrap(Handler handler) {
    return [this, handler](const httplib::Request& req, httplib::Response& res) {
        auto started = std::chrono::steady_clock::now();

        ApiReply reply = handler(req);
        res.status = reply.status;
        res.set_content(reply.body.dump(), "application/json");

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        meter_.record(IngressMeter::channel_for(req.method, req.path), elapsed, reply.status);
        spdlog::debug("{} {} -> {} ({} us)", req.method, req.path, reply.status, elapsed.count());
    };
}

void HttpServer::setup_routes() {
    server_->Get("/", wrap([this](const httplib::Request&) { return api_.root(); }));
    server_->Get("/health", wrap([this](const httplib::Request&) { return api_.health(); }));

    // Agents
    server_->Get("/agents", wrap([this](const httplib::Request&) { return api_.list_agents(); }));
    server_->Post("/agents/register", wrap([this](const httplib::Request& req) {
        return api_.register_agent(req.body);
    }));
    server_->Get(R"(/agents/([^/]+))", wrap([this](const httplib::Request& req) {
        return api_.get_agent(req.matches[1]);
    }));
    server_->Post(R"(/agents/([^/]+)/metrics)", wrap([this](const httplib::Request& req) {
        return api_.post_metrics(req.matches[1], req.body);
    }));
    server_->Get(R"(/agents/([^/]+)/metrics)", wrap([this](const httplib::Request& req) {
        return api_.get_metrics(req.matches[1], query_param(req, "limit"));
    }));

    // Findings
    server_->Get("/threats", wrap([this](const httplib::Request&) { return api_.list_threats(); }));
    server_->Post("/threats", wrap([this](const httplib::Request& req) {
        return api_.create_threat(req.body);
    }));
    server_->Post("/evidence", wrap([this](const httplib::Request& req) {
        return api_.create_evidence(req.body);
    }));

    // Events
    server_->Get("/events", wrap([this](const httplib::Request& req) {
        return api_.list_events(query_param(req, "limit"), query_param(req, "source"));
    }));
    server_->Get(R"(/events/([^/]+))", wrap([this](const httplib::Request& req) {
        return api_.get_event(req.matches[1]);
    }));
    server_->Post(R"(/events/([^/]+)/acknowledge)", wrap([this](const httplib::Request& req) {
        return api_.acknowledge_event(req.matches[1]);
    }));

    // Derived snapshots
    server_->Get("/system-health", wrap([this](const httplib::Request&) { return api_.system_health(); }));
    server_->Get("/network-metrics", wrap([this](const httplib::Request&) { return api_.network_metrics(); }));
    server_->Get("/system/status", wrap([this](const httplib::Request&) { return api_.system_status(); }));

    server_->Post("/admin/reset", wrap([this](const httplib::Request&) { return api_.admin_reset(); }));

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            nlohmann::json body = {{"success", false}, {"error", res.status == 404 ? "Not Found" : "Request failed"}};
            res.set_content(body.dump(), "application/json");
        }
    });
}
