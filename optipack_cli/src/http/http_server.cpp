#include "http_server.hpp"
#include "../../../liboptipack/include/errors.hpp"
#include "../../../liboptipack/include/logger.hpp"
#include "../../../liboptipack/include/progress_event.hpp"
#include "../../../liboptipack/include/stream_session.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <functional>

using json = nlohmann::json;
using namespace optipack;

namespace {

    const char* http_tag() {
        return "HttpServer";
    }

    void send_json(httplib::Response& res, const json& payload, const int status = 200) {
        res.status = status;
        res.set_content(payload.dump(), "application/json");
    }

    void send_error(httplib::Response& res, const int status, const std::string& message) {
        send_json(res, json{{"status", "error"}, {"message", message}}, status);
    }

    // maps the library's exception taxonomy onto status codes
    void guarded(httplib::Response& res, const std::function<void()>& handler) {
        try {
            handler();
        } catch (const ValidationError& e) {
            send_error(res, 400, e.what());
        } catch (const NotFoundError& e) {
            send_error(res, 404, e.what());
        } catch (const ServiceUnavailableError& e) {
            send_error(res, 503, e.what());
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Request failed: ") + e.what(), http_tag());
            send_error(res, 500, "internal error");
        }
    }

    // multipart fields arrive as files, urlencoded ones as params
    std::string form_value(const httplib::Request& req, const std::string& key) {
        if (req.has_file(key)) return req.get_file_value(key).content;
        if (req.has_param(key)) return req.get_param_value(key);
        return {};
    }

    std::int64_t unix_seconds(const Clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    json snapshot_to_json(const JobSnapshot& job) {
        json results = json::array();
        for (const auto& r : job.results) {
            results.push_back(to_json(r));
        }
        json j = {
            {"job_id", job.id},
            {"state", to_string(job.state)},
            {"options", {
                {"jpeg_quality", job.options.jpeg_quality},
                {"convert_png", job.options.convert_png_to_jpeg}
            }},
            {"created_at", unix_seconds(job.created_at)},
            {"total_entries", job.total_entries},
            {"processed_entries", job.processed_entries},
            {"percent", job.percent},
            {"results", std::move(results)}
        };
        if (job.finished_at) j["finished_at"] = unix_seconds(*job.finished_at);
        if (job.artifact_id) j["artifact_id"] = *job.artifact_id;
        if (job.failure_reason) j["failure_reason"] = *job.failure_reason;
        return j;
    }

    // a session and the serving thread it holds
    struct OpenStream {
        OpenStream(StreamSlots::Slot s, std::shared_ptr<EventSubscription> subscription,
                   const std::chrono::milliseconds keepalive)
            : slot(std::move(s)), session(std::move(subscription), keepalive) {}

        StreamSlots::Slot slot;
        StreamSession session;
    };

} // namespace

HttpServer::HttpServer(OptimizationService& service,
                       const std::chrono::milliseconds keepalive_interval,
                       const std::size_t max_upload_bytes,
                       const unsigned http_threads)
    : service_(service), keepalive_(keepalive_interval),
      stream_slots_(StreamSlots::capacity_for_pool(http_threads)),
      server_(std::make_unique<httplib::Server>()) {
    server_->set_payload_max_length(max_upload_bytes);
    server_->new_task_queue = [http_threads] { return new httplib::ThreadPool(http_threads); };
    register_routes();
}

HttpServer::~HttpServer() = default;

bool HttpServer::listen(const std::string& host, const int port) {
    Logger::log(LogLevel::Info, "Listening on " + host + ":" + std::to_string(port), http_tag());
    return server_->listen(host, port);
}

void HttpServer::stop() {
    server_->stop();
}

void HttpServer::register_routes() {
    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, json{{"status", "ok"}});
    });

    server_->Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
        const ServiceStats s = service_.stats();
        send_json(res, json{
            {"jobs_submitted", s.jobs_submitted},
            {"jobs_completed", s.jobs_completed},
            {"jobs_failed", s.jobs_failed},
            {"files_processed", s.files_processed}
        });
    });

    server_->Post("/optimize", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            if (!req.has_file("zip_file")) {
                throw ValidationError("missing multipart field 'zip_file'");
            }
            const auto& upload = req.get_file_value("zip_file");
            const OptimizationOptions options = OptimizationOptions::parse(
                form_value(req, "jpeg_quality"), form_value(req, "convert_png"));

            const JobId id = service_.submit(to_buffer(upload.content), options);
            Logger::log(LogLevel::Debug, "Upload '" + upload.filename + "' from " + req.remote_addr +
                        " queued as job " + id, http_tag());
            send_json(res, json{{"status", "accepted"}, {"job_id", id}}, 202);
        });
    });

    server_->Get(R"(/optimize-stream/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            auto slot = stream_slots_.try_acquire();
            if (!slot) {
                throw ServiceUnavailableError("all " + std::to_string(stream_slots_.capacity()) +
                                              " progress streams are in use");
            }
            auto stream = std::make_shared<OpenStream>(std::move(*slot), service_.stream_events(req.matches[1]),
                                                       keepalive_);
            res.set_header("Cache-Control", "no-cache");
            res.set_header("X-Accel-Buffering", "no");
            res.set_chunked_content_provider(
                "text/event-stream",
                [stream](std::size_t, httplib::DataSink& sink) {
                    const auto result = stream->session.pump([&sink](const std::string_view frame) {
                        return sink.write(frame.data(), frame.size());
                    });
                    switch (result) {
                        case StreamSession::PumpResult::Continue:
                            return true;
                        case StreamSession::PumpResult::Finished:
                            sink.done();
                            return true;
                        case StreamSession::PumpResult::Disconnected:
                            return false;
                    }
                    return false;
                },
                [stream](bool) { stream->session.release(); });
        });
    });

    server_->Get(R"(/jobs/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            send_json(res, snapshot_to_json(service_.lookup(req.matches[1])));
        });
    });

    server_->Get(R"(/download/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            const ByteBuffer bytes = service_.fetch_artifact(req.matches[1]);
            res.set_header("Content-Disposition", "attachment; filename=\"optimized_images.zip\"");
            res.set_content(reinterpret_cast<const char*>(bytes.data()), bytes.size(), "application/zip");
        });
    });
}
