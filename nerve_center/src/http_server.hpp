#pragma once
#include "config.hpp"
#include "hub_api.hpp"
#include "ingress_meter.hpp"
#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>

// HTTP/JSON boundary. Routes map onto HubApi handlers; every request is
// timed and recorded in the ingress meter.
class HttpServer {
public:
    HttpServer(const Config& config, HubApi& api, IngressMeter& meter);
    ~HttpServer();

    void start();
    void stop();
    bool is_running() const;

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

private:
    using Handler = std::function<ApiReply(const httplib::Request&)>;

    void setup_routes();
    httplib::Server::Handler wrap(Handler handler);

    const Config& config_;
    HubApi& api_;
    IngressMeter& meter_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
};
