#ifndef STATUS_HTTP_SERVER_HPP
#define STATUS_HTTP_SERVER_HPP

#include <atomic>
#include <string>
#include <thread>
#include "PipelineController.hpp"

// JSON body served on /data.
std::string render_status_json(const PipelineSnapshot& snap);

/**
 * @brief Small dashboard over Boost.Asio.
 *
 *   "/"           : HTML page that polls /data every second
 *   "/data"       : JSON with heart rate, buffer state and recent peaks
 *   "/export.csv" : the resident buffer as CSV
 *
 * One connection at a time on a private thread; it only ever reads
 * snapshots from the pipeline.
 */
class StatusHttpServer {
public:
    StatusHttpServer(const PipelineController& pipeline, unsigned short port,
                     double window_seconds = 5.0);
    ~StatusHttpServer();

    void start();
    void stop();

    // Full HTTP response for a request line such as "GET /data HTTP/1.1".
    std::string respond(const std::string& request_line) const;

private:
    void serve_loop();

    const PipelineController& pipeline_;
    unsigned short port_;
    double window_seconds_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

#endif // STATUS_HTTP_SERVER_HPP
