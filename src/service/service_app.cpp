#include "service/service_app.hpp"

#include <ctime>
#include <iomanip>
#include <optional>
#include <signal.h>
#include <sstream>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include "protocol/json_codec.hpp"
#include "runtime/process_manager.hpp"
#include "runtime/runner.hpp"

namespace agentrt::service {

using core::config::DeploymentMode;
using core::config::ResponseType;
using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string iso_timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::string dump_payload(const json& payload) {
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

void send_json(httplib::Response& res, const int status, const json& payload) {
    res.status = status;
    res.set_content(dump_payload(payload), "application/json");
}

void send_error(httplib::Response& res, const int status, const std::string& code,
                const std::string& message) {
    json payload;
    payload["error"] = {{"code", code}, {"message", message}};
    send_json(res, status, payload);
}

// Pulls one event per provider callback and writes it as an SSE frame.
class SseSession {
public:
    SseSession(runtime::QueryStream stream, std::shared_ptr<core::logging::Logger> logger)
        : stream_(std::move(stream)), logger_(std::move(logger)) {}

    bool pump(httplib::DataSink& sink) {
        if (closed_) {
            sink.done();
            return true;
        }

        std::string frame;
        try {
            std::optional<protocol::Event> event = stream_.next();
            if (!event.has_value()) {
                closed_ = true;
                sink.done();
                return true;
            }
            last_sequence_ = event->sequence_number;
            frame = "data: " + dump_payload(protocol::event_to_json(*event)) + "\n\n";
            closed_ = stream_.finished();
        } catch (const std::exception& e) {
            frame = failure_frame(e.what());
            closed_ = true;
        }

        if (!sink.write(frame.data(), frame.size())) {
            AGENTRT_LOG_WARN(logger_, "ServiceApp: client disconnected from response " +
                                          stream_.envelope().id);
            return false;
        }
        if (closed_) {
            sink.done();
        }
        return true;
    }

private:
    std::string failure_frame(const std::string& message) {
        protocol::AgentResponse envelope = stream_.envelope();
        envelope.failed(protocol::ErrorInfo{"internal_error", message});
        protocol::Event event;
        event.sequence_number = last_sequence_ + 1;
        event.body = std::move(envelope);
        AGENTRT_LOG_ERROR(logger_, "ServiceApp: stream aborted: " + message);
        return "data: " + dump_payload(protocol::event_to_json(event)) + "\n\n";
    }

    runtime::QueryStream stream_;
    std::shared_ptr<core::logging::Logger> logger_;
    std::int64_t last_sequence_ = -1;
    bool closed_ = false;
};

}  // namespace

ServiceApp::ServiceApp(runtime::Runner& runner, ServiceOptions options)
    : runner_(runner),
      options_(std::move(options)),
      server_(std::make_unique<httplib::Server>()) {
    logger_ = options_.logger ? options_.logger : core::logging::Logger::make_default("service");
    if (!options_.shutdown_action) {
        const auto delay = options_.shutdown_delay;
        options_.shutdown_action = [delay]() {
            std::thread([delay]() {
                std::this_thread::sleep_for(delay);
                static_cast<void>(kill(getpid(), SIGTERM));
            }).detach();
        };
    }
    configure_routes();
}

ServiceApp::~ServiceApp() { stop(); }

core::errors::Result<int> ServiceApp::bind() {
    const auto& config = options_.config;
    if (bound_.load()) {
        return AgentError{ErrorCategory::Deployment, "Service is already bound to port " +
                                                         std::to_string(port_.load()) + ".",
                          core::errors::codes::kAlreadyRunning};
    }

    int bound_port = config.port;
    if (config.port == 0) {
        bound_port = server_->bind_to_any_port(config.host);
    } else if (!server_->bind_to_port(config.host, config.port)) {
        bound_port = -1;
    }
    if (bound_port < 0) {
        AGENTRT_LOG_ERROR(logger_, "ServiceApp: cannot bind " + config.host + ":" +
                                       std::to_string(config.port));
        return AgentError{ErrorCategory::Deployment,
                          "Failed to bind " + config.host + ":" + std::to_string(config.port) + ".",
                          "bind_failed", "Is another process already listening on this port?"};
    }

    port_.store(bound_port);
    bound_.store(true);
    AGENTRT_LOG_DEBUG(logger_, "ServiceApp: bound " + config.host + ":" + std::to_string(bound_port));
    return bound_port;
}

core::errors::Result<bool> ServiceApp::listen() {
    if (!bound_.load()) {
        return AgentError{ErrorCategory::Internal, "Service must be bound before listening.",
                          "service_not_bound"};
    }

    listen_pending_.store(true);
    if (stop_requested_.load()) {
        listen_pending_.store(false);
        AGENTRT_LOG_INFO(logger_, "ServiceApp: stopped before listening");
        return true;
    }

    AGENTRT_LOG_INFO(logger_, "ServiceApp: listening on http://" + options_.config.host + ":" +
                                  std::to_string(port_.load()) + " (mode=" +
                                  core::config::to_string(options_.config.mode) + ")");
    const bool clean = server_->listen_after_bind();
    listen_pending_.store(false);
    bound_.store(false);
    if (!clean) {
        return AgentError{ErrorCategory::Internal, "HTTP accept loop ended with an error.",
                          "listen_failed"};
    }
    AGENTRT_LOG_INFO(logger_, "ServiceApp: stopped listening");
    return true;
}

void ServiceApp::stop() {
    stop_requested_.store(true);
    if (!server_) {
        return;
    }
    // httplib ignores stop() until the accept loop runs; wait out a listen()
    // that is past its stop check but not yet accepting.
    for (int attempt = 0; attempt < 1000 && listen_pending_.load() && !server_->is_running();
         ++attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    server_->stop();
}

bool ServiceApp::is_running() const { return server_ && server_->is_running(); }

json ServiceApp::health_payload() const {
    json payload;
    payload["status"] = healthy_.load() ? "healthy" : "unhealthy";
    payload["timestamp"] = iso_timestamp();
    payload["service"] = options_.service_name;
    payload["mode"] = core::config::to_string(options_.config.mode);
    payload["pid"] = static_cast<long>(getpid());
    return payload;
}

json ServiceApp::root_payload() const {
    const auto& config = options_.config;
    json endpoints;
    endpoints["process"] = "POST " + config.endpoint_path;
    endpoints["health"] = "GET /health";
    endpoints["readiness"] = "GET /readiness";
    endpoints["liveness"] = "GET /liveness";
    if (config.mode == DeploymentMode::DetachedProcess) {
        endpoints["admin_shutdown"] = "POST /admin/shutdown";
        endpoints["admin_status"] = "GET /admin/status";
    }
    if (config.mode == DeploymentMode::Standalone) {
        endpoints["config"] = "GET /config";
    }

    json payload;
    payload["service"] = options_.service_name;
    payload["mode"] = core::config::to_string(config.mode);
    payload["endpoints"] = endpoints;
    return payload;
}

json ServiceApp::config_payload() const {
    const auto& config = options_.config;
    json payload;
    payload["mode"] = core::config::to_string(config.mode);
    payload["endpoint"] = config.endpoint_path;
    payload["response_type"] = core::config::to_string(config.response_type);
    payload["stream"] = config.stream;
    return payload;
}

json ServiceApp::status_payload() const {
    const runtime::ProcessManager processes;
    auto status = processes.query_status(getpid());

    json payload;
    payload["pid"] = static_cast<long>(getpid());
    payload["status"] = "running";
    if (core::errors::is_error(status)) {
        payload["memory_usage"] = nullptr;
        payload["cpu_percent"] = nullptr;
        payload["uptime"] = nullptr;
        return payload;
    }
    const auto& snapshot = core::errors::get_value(status);
    payload["memory_usage"] = snapshot.rss_bytes;
    payload["cpu_percent"] = snapshot.cpu_percent;
    payload["uptime"] = snapshot.uptime_seconds;
    return payload;
}

void ServiceApp::configure_routes() {
    const auto& config = options_.config;

    // Exclusive bind: no SO_REUSEPORT, so a port held by another listener fails to bind.
    server_->set_socket_options([](socket_t sock) {
        int yes = 1;
        static_cast<void>(setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
                                     reinterpret_cast<const void*>(&yes), sizeof(yes)));
    });

    if (config.mode == DeploymentMode::DetachedProcess) {
        server_->set_default_headers({{"X-Process-Mode", "detached"}});
    } else if (config.mode == DeploymentMode::Standalone) {
        server_->set_default_headers({{"X-Deployment-Mode", "standalone"}});
    }

    server_->set_logger([logger = logger_](const httplib::Request& req, const httplib::Response& res) {
        AGENTRT_LOG_INFO(logger, req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    server_->Post(config.endpoint_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_query(req, res);
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, health_payload());
    });

    server_->Get("/readiness", [this](const httplib::Request&, httplib::Response& res) {
        if (!ready_.load()) {
            send_json(res, 500, json{{"detail", "Runner is not started"}});
            return;
        }
        res.set_content("success", "text/plain");
    });

    server_->Get("/liveness", [this](const httplib::Request&, httplib::Response& res) {
        if (!healthy_.load()) {
            send_json(res, 500, json{{"detail", "Service is unhealthy"}});
            return;
        }
        res.set_content("success", "text/plain");
    });

    server_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, root_payload());
    });

    if (config.mode == DeploymentMode::DetachedProcess) {
        server_->Post("/admin/shutdown", [this](const httplib::Request&, httplib::Response& res) {
            AGENTRT_LOG_INFO(logger_, "ServiceApp: shutdown requested over HTTP");
            options_.shutdown_action();
            send_json(res, 200, json{{"message", "Shutdown initiated"}});
        });
        server_->Get("/admin/status", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, 200, status_payload());
        });
    }

    if (config.mode == DeploymentMode::Standalone) {
        server_->Get("/config", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, 200, config_payload());
        });
    }
}

void ServiceApp::handle_query(const httplib::Request& req, httplib::Response& res) {
    auto parsed = protocol::parse_agent_request_text(req.body);
    if (core::errors::is_error(parsed)) {
        const auto& error = core::errors::get_error(parsed);
        AGENTRT_LOG_WARN(logger_, "ServiceApp: rejected request: " + error.message);
        send_error(res, 400, error.code, error.message);
        return;
    }

    auto& request = core::errors::get_value(parsed);
    const bool stream_events = options_.config.response_type == ResponseType::Sse &&
                               options_.config.stream && request.stream;

    auto opened = runner_.stream_query(std::move(request));
    if (core::errors::is_error(opened)) {
        const auto& error = core::errors::get_error(opened);
        send_error(res, 400, error.code, error.message);
        return;
    }

    if (!stream_events) {
        try {
            const protocol::AgentResponse envelope = core::errors::get_value(opened).drain();
            send_json(res, 200, protocol::response_to_json(envelope));
        } catch (const std::exception& e) {
            AGENTRT_LOG_ERROR(logger_, std::string("ServiceApp: query failed: ") + e.what());
            send_error(res, 500, "internal_error", e.what());
        }
        return;
    }

    auto session = std::make_shared<SseSession>(std::move(core::errors::get_value(opened)), logger_);
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_chunked_content_provider(
        "text/event-stream",
        [session](size_t, httplib::DataSink& sink) { return session->pump(sink); });
}

}  // namespace agentrt::service
