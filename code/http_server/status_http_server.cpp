#include "status_http_server.hpp"
#include "CsvExporter.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace boost::asio;
using namespace boost::asio::ip;
using namespace std::chrono;

static const char* const DASHBOARD_HTML = R"(
<!DOCTYPE html>
<html>
<head>
  <meta charset="UTF-8">
  <title>ECG Monitor</title>
  <script>
    function updateData() {
      fetch('/data')
      .then(response => response.json())
      .then(data => {
         document.getElementById("bpm").innerText = data.valid ? data.bpm_filtered.toFixed(0) : "--";
         document.getElementById("instant").innerText = data.bpm_instant.toFixed(1);
         document.getElementById("period").innerText = data.valid ? data.mean_period_s.toFixed(2) + " s" : "--";
         document.getElementById("p2p").innerText = data.peak_to_peak_v.toFixed(2) + " V";
         document.getElementById("sps").innerText = data.measured_rate_hz.toFixed(1);
         document.getElementById("buffer").innerText = data.buffer_size + " / " + data.capacity;
      })
      .catch(err => console.error(err));
    }
    setInterval(updateData, 1000);
    window.onload = updateData;
  </script>
</head>
<body>
  <h1>ECG Monitor</h1>
  <p>BPM: <span id="bpm"></span></p>
  <p>Instant BPM: <span id="instant"></span></p>
  <p>Period: <span id="period"></span></p>
  <p>Pk-Pk: <span id="p2p"></span></p>
  <p>Sample rate: <span id="sps"></span> sps</p>
  <p>Buffer: <span id="buffer"></span></p>
  <p><a href="/export.csv">Download CSV</a></p>
</body>
</html>
)";

static std::string make_response(const std::string& content_type, const std::string& body) {
    std::stringstream response_stream;
    response_stream << "HTTP/1.1 200 OK\r\n";
    response_stream << "Content-Type: " << content_type << "\r\n";
    response_stream << "Content-Length: " << body.size() << "\r\n";
    response_stream << "Connection: close\r\n";
    response_stream << "\r\n";
    response_stream << body;
    return response_stream.str();
}

std::string render_status_json(const PipelineSnapshot& snap) {
    std::stringstream json;
    json << std::fixed << std::setprecision(3);
    json << "{";
    json << "\"bpm_instant\":" << snap.rate.bpm_instant << ",";
    json << "\"bpm_filtered\":" << snap.rate.bpm_filtered << ",";
    json << "\"valid\":" << (snap.rate.valid ? "true" : "false") << ",";
    json << "\"mean_period_s\":" << snap.rate.mean_period_s << ",";
    json << "\"rejected_intervals\":" << snap.rate.rejected_intervals << ",";
    json << "\"buffer_size\":" << snap.buffer.size << ",";
    json << "\"capacity\":" << snap.buffer.capacity << ",";
    json << "\"total_ingested\":" << snap.buffer.total_ingested << ",";
    json << "\"total_evicted\":" << snap.buffer.total_evicted << ",";
    json << "\"measured_rate_hz\":" << snap.measured_rate_hz << ",";
    json << "\"peak_to_peak_v\":" << snap.peak_to_peak_v << ",";
    json << "\"peaks\":[";
    for (size_t i = 0; i < snap.recent_peaks.size(); ++i) {
        const PeakEvent& p = snap.recent_peaks[i];
        if (i > 0)
            json << ",";
        json << "{\"sequence\":" << p.sequence
             << ",\"timestamp\":" << std::setprecision(6) << p.timestamp
             << ",\"voltage\":" << std::setprecision(6) << p.voltage << "}";
    }
    json << "]";
    json << "}";
    return json.str();
}

StatusHttpServer::StatusHttpServer(const PipelineController& pipeline, unsigned short port,
                                   double window_seconds)
    : pipeline_(pipeline), port_(port), window_seconds_(window_seconds), running_(false) {}

StatusHttpServer::~StatusHttpServer() {
    stop();
}

void StatusHttpServer::start() {
    if (running_)
        return;
    running_ = true;
    server_thread_ = std::thread(&StatusHttpServer::serve_loop, this);
}

void StatusHttpServer::stop() {
    running_ = false;
    if (server_thread_.joinable())
        server_thread_.join();
}

std::string StatusHttpServer::respond(const std::string& request_line) const {
    if (request_line.find("GET /data") != std::string::npos) {
        return make_response("application/json", render_status_json(pipeline_.snapshot(window_seconds_)));
    }
    if (request_line.find("GET /export.csv") != std::string::npos) {
        // Copy first; serializing happens without holding the pipeline lock.
        std::vector<Sample> rows = pipeline_.export_all();
        std::ostringstream csv;
        CsvExporter().write(csv, rows);
        return make_response("text/csv", csv.str());
    }
    return make_response("text/html", DASHBOARD_HTML);
}

void StatusHttpServer::serve_loop() {
    try {
        io_context io;
        tcp::endpoint endpoint(tcp::v4(), port_);
        tcp::acceptor acceptor(io, endpoint);
        // Non-blocking so the loop notices stop().
        acceptor.non_blocking(true);
        std::cout << "Status HTTP server started on port " << port_ << std::endl;

        while (running_) {
            tcp::socket socket(io);
            boost::system::error_code ec;
            acceptor.accept(socket, ec);
            if (ec) {
                if (ec == error::would_block || ec == error::try_again) {
                    std::this_thread::sleep_for(milliseconds(100));
                } else {
                    std::cerr << "Accept error: " << ec.message() << std::endl;
                }
                continue;
            }

            boost::asio::streambuf request;
            read_until(socket, request, "\r\n\r\n", ec);
            if (ec && ec != error::eof) {
                std::cerr << "Request read error: " << ec.message() << std::endl;
                continue;
            }
            std::istream request_stream(&request);
            std::string request_line;
            std::getline(request_stream, request_line);
            if (!request_line.empty() && request_line.back() == '\r') {
                request_line.pop_back();
            }

            write(socket, buffer(respond(request_line)), ec);
            if (ec) {
                std::cerr << "Response write error: " << ec.message() << std::endl;
            }
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    } catch (const std::exception& e) {
        std::cerr << "HTTP server exception: " << e.what() << std::endl;
        running_ = false;
    }
}
