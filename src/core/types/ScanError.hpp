/**
 * @file ScanError.hpp
 * @brief Fatal error taxonomy for a scan invocation.
 *
 * Per-probe failures are outcomes, not errors, and never appear here.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace portsweep::core {

/**
 * @brief Categories of fatal scan errors.
 */
enum class ErrorCode : int {
    InvalidTargetSpec = 1,       ///< Malformed CIDR/IP literal or unreadable hosts file
    EmptyTargetSpec = 2,         ///< Target resolved to no hosts
    InvalidPortSpec = 3,         ///< A port token is not an integer or range
    EmptyPortSpec = 4,           ///< No valid port remained after parsing
    UnsupportedOutputFormat = 5, ///< Output extension is neither .csv nor .json
    OutputWriteFailed = 6,       ///< Output file could not be written
    InvalidArgument = 7          ///< Command-line usage error
};

/**
 * @brief Converts an ErrorCode to its stable name.
 * @param code The error code.
 * @return Name such as "InvalidPortSpec".
 */
std::string errorCodeToString(ErrorCode code);

/**
 * @brief Exception raised for fatal configuration and output errors.
 */
class ScanError : public std::runtime_error {
public:
    ScanError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /**
     * @brief Process exit status for this error.
     * @return 2 for command-line usage errors, 1 otherwise.
     */
    [[nodiscard]] int exitStatus() const noexcept;

private:
    ErrorCode code_;
};

} // namespace portsweep::core
