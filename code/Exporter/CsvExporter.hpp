#ifndef CSV_EXPORTER_HPP
#define CSV_EXPORTER_HPP

#include <iosfwd>
#include <string>
#include <vector>
#include "EcgTypes.hpp"

/**
 * @brief Writes samples as "sequence,timestamp,adc_raw,voltage" rows.
 *
 * Works on an already copied sample vector, never on the live buffer, so a
 * slow disk does not hold up acquisition.
 */
class CsvExporter {
public:
    static const char* const HEADER;

    explicit CsvExporter(int time_precision = 6, int voltage_precision = 6);

    void write(std::ostream& os, const std::vector<Sample>& samples) const;

    // Throws ExportError carrying [first, last] if the file cannot be written.
    void write_file(const std::string& path, const std::vector<Sample>& samples,
                    uint64_t first, uint64_t last) const;

    // Parses output of write(). Throws CsvFormatError on a malformed row.
    static std::vector<Sample> read(std::istream& is);
    static std::vector<Sample> read_file(const std::string& path);

private:
    int time_precision_;
    int voltage_precision_;
};

#endif // CSV_EXPORTER_HPP
