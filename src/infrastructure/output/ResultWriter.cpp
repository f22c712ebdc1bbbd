#include "infrastructure/output/ResultWriter.hpp"

#include "core/types/ScanError.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace portsweep::infra {

namespace {

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

OutputFormat outputFormatFromPath(const std::filesystem::path& path) {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".csv") {
        return OutputFormat::Csv;
    }
    if (extension == ".json") {
        return OutputFormat::Json;
    }
    throw core::ScanError(core::ErrorCode::UnsupportedOutputFormat,
                          "Unsupported output format for " + path.string() +
                              ": use a .csv or .json extension");
}

std::string ResultWriter::toCsv(const std::vector<core::OpenPair>& pairs) {
    std::ostringstream oss;
    oss << "host,port\n";
    for (const auto& pair : pairs) {
        oss << csvField(pair.host) << "," << pair.port << "\n";
    }
    return oss.str();
}

std::string ResultWriter::toJson(const std::vector<core::OpenPair>& pairs) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& pair : pairs) {
        nlohmann::json entry;
        entry["host"] = pair.host;
        entry["port"] = pair.port;
        j.push_back(entry);
    }
    return j.dump(2);
}

void ResultWriter::writeConsole(std::ostream& out, const std::vector<core::OpenPair>& pairs) {
    if (pairs.empty()) {
        out << "\nNo open ports found.\n";
        return;
    }

    out << "\nOpen ports:\n";
    for (const auto& pair : pairs) {
        out << pair.toString() << "\n";
    }
    out.flush();
}

std::string ResultWriter::formatOpenLine(const core::OpenPair& pair) {
    auto line = "[+] " + pair.toString() + " open";
    auto service = core::ServiceDetector::detectService(pair.port);
    if (!service.empty()) {
        line += " (" + service + ")";
    }
    return line;
}

void ResultWriter::writeFile(const std::filesystem::path& path,
                             const std::vector<core::OpenPair>& pairs) {
    auto format = outputFormatFromPath(path);
    auto content = format == OutputFormat::Csv ? toCsv(pairs) : toJson(pairs);

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw core::ScanError(core::ErrorCode::OutputWriteFailed,
                              "Failed to open output file for writing: " + path.string());
    }

    file << content;
    if (format == OutputFormat::Json) {
        file << "\n";
    }
    file.close();
    if (!file) {
        throw core::ScanError(core::ErrorCode::OutputWriteFailed,
                              "Failed to write output file: " + path.string());
    }

    spdlog::debug("Wrote {} open pairs to {}", pairs.size(), path.string());
}

} // namespace portsweep::infra
