#ifndef OPTIPACK_HTTP_SERVER_HPP
#define OPTIPACK_HTTP_SERVER_HPP

#include "../../../liboptipack/include/optipack.hpp"
#include "../../../liboptipack/include/stream_session.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace httplib { class Server; }

/**
 * @brief HTTP front end of an OptimizationService.
 *
 * Routes:
 * - POST /optimize              multipart upload (zip_file, jpeg_quality, convert_png) -> 202 + job id
 * - GET  /optimize-stream/<id>  server-sent events of the job
 * - GET  /jobs/<id>             job snapshot
 * - GET  /download/<id>         the optimized archive (job id or artifact id)
 * - GET  /stats, GET /health
 *
 * Error mapping: ValidationError 400, NotFoundError 404,
 * ServiceUnavailableError 503, anything else 500.
 *
 * Open progress streams are capped below the HTTP thread count; a stream
 * request beyond the cap is answered with 503.
 */
class HttpServer {
public:
    HttpServer(optipack::OptimizationService& service,
               std::chrono::milliseconds keepalive_interval,
               std::size_t max_upload_bytes,
               unsigned http_threads);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Binds and serves until stop() is called.
     * @return false if the address cannot be bound.
     */
    bool listen(const std::string& host, int port);

    void stop();

private:
    void register_routes();

    optipack::OptimizationService& service_;
    std::chrono::milliseconds keepalive_;
    optipack::StreamSlots stream_slots_;
    std::unique_ptr<httplib::Server> server_;
};

#endif // OPTIPACK_HTTP_SERVER_HPP
