#pragma once

#include "core/types/ProbeTask.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace portsweep::infra {

/**
 * @brief File format for exported scan results.
 */
enum class OutputFormat { Csv, Json };

/**
 * @brief Selects the file format from a path's extension.
 * @param path Output path; ".csv" or ".json", case-insensitive.
 * @return OutputFormat::Csv or OutputFormat::Json.
 * @throws ScanError UnsupportedOutputFormat for any other extension.
 */
OutputFormat outputFormatFromPath(const std::filesystem::path& path);

/**
 * @brief Renders open pairs to the console, CSV or JSON.
 *
 * Callers pass pairs already sorted by (host, port); the writer keeps that order.
 */
class ResultWriter {
public:
    /**
     * @brief Exports open pairs to CSV format.
     * @return Header row "host,port" followed by one row per pair.
     */
    static std::string toCsv(const std::vector<core::OpenPair>& pairs);

    /**
     * @brief Exports open pairs to JSON format.
     * @return Array of {"host": string, "port": integer}, indented by two spaces.
     */
    static std::string toJson(const std::vector<core::OpenPair>& pairs);

    /**
     * @brief Prints the final listing of open pairs, one "host:port" per line.
     */
    static void writeConsole(std::ostream& out, const std::vector<core::OpenPair>& pairs);

    /**
     * @brief Formats the line printed when a port is found open during a scan.
     * @return e.g. "[+] 10.0.0.1:22 open (ssh)".
     */
    static std::string formatOpenLine(const core::OpenPair& pair);

    /**
     * @brief Writes open pairs to a file in the format its extension selects.
     * @throws ScanError UnsupportedOutputFormat or OutputWriteFailed.
     */
    static void writeFile(const std::filesystem::path& path,
                          const std::vector<core::OpenPair>& pairs);
};

} // namespace portsweep::infra
