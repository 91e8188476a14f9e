#include "CsvExporter.hpp"
#include "EcgErrors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

const char* const CsvExporter::HEADER = "sequence,timestamp,adc_raw,voltage";

CsvExporter::CsvExporter(int time_precision, int voltage_precision)
    : time_precision_(time_precision), voltage_precision_(voltage_precision)
{
    if (time_precision_ < 0 || time_precision_ > 12 ||
        voltage_precision_ < 0 || voltage_precision_ > 12) {
        throw ConfigError("CSV precision must be between 0 and 12 decimal places");
    }
}

void CsvExporter::write(std::ostream& os, const std::vector<Sample>& samples) const {
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();
    os << HEADER << '\n';
    os << std::fixed;
    for (const auto& s : samples) {
        os << s.sequence << ','
           << std::setprecision(time_precision_) << s.timestamp << ','
           << s.adc_raw << ','
           << std::setprecision(voltage_precision_) << s.voltage << '\n';
    }
    os.flags(flags);
    os.precision(precision);
}

void CsvExporter::write_file(const std::string& path, const std::vector<Sample>& samples,
                             uint64_t first, uint64_t last) const {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw ExportError("Failed to open export file " + path + ": " + std::strerror(errno),
                          first, last);
    }
    write(out, samples);
    out.flush();
    if (!out.good()) {
        throw ExportError("Failed to write export file " + path, first, last);
    }
}

std::vector<Sample> CsvExporter::read(std::istream& is) {
    std::vector<Sample> samples;
    std::string line;
    size_t line_no = 0;

    if (!std::getline(is, line)) {
        throw CsvFormatError("Missing CSV header", 1);
    }
    ++line_no;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    if (line != HEADER) {
        throw CsvFormatError("Unexpected CSV header [" + line + "]", line_no);
    }

    while (std::getline(is, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        std::istringstream iss(line);
        std::string token;
        std::vector<std::string> tokens;
        while (std::getline(iss, token, ','))
            tokens.push_back(token);
        if (tokens.size() != 4) {
            throw CsvFormatError("Expected 4 columns, got " + std::to_string(tokens.size()), line_no);
        }

        Sample s;
        try {
            size_t used = 0;
            s.sequence = std::stoull(tokens[0], &used);
            if (used != tokens[0].size()) throw std::invalid_argument(tokens[0]);
            s.timestamp = std::stod(tokens[1], &used);
            if (used != tokens[1].size()) throw std::invalid_argument(tokens[1]);
            s.adc_raw = std::stoll(tokens[2], &used);
            if (used != tokens[2].size()) throw std::invalid_argument(tokens[2]);
            s.voltage = std::stod(tokens[3], &used);
            if (used != tokens[3].size()) throw std::invalid_argument(tokens[3]);
        } catch (const std::logic_error& e) {
            throw CsvFormatError("Bad numeric field [" + std::string(e.what()) + "]", line_no);
        }
        samples.push_back(s);
    }
    return samples;
}

std::vector<Sample> CsvExporter::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ExportError("Failed to open CSV file " + path + ": " + std::strerror(errno), 0, 0);
    }
    return read(in);
}
