// =============================================================================
// saudi-id - Validate Command
// =============================================================================
// Command handler for validating candidate identifiers.
//
// This module provides:
// - ValidateCommand: Validate ids from arguments, a file or stdin
// - Per-candidate result lines and an overall summary
// =============================================================================

#ifndef SID_COMMANDS_VALIDATE_COMMAND_H
#define SID_COMMANDS_VALIDATE_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sid/common/error.h"
#include "sid/core/id.h"

namespace sid::commands {

// =============================================================================
// Validation Result
// =============================================================================

/// @brief Outcome for one candidate.
struct CandidateResult {
    /// @brief Candidate text as supplied.
    std::string text;

    /// @brief Category when the candidate is valid.
    std::optional<core::IdType> type;

    /// @brief Rejection reason when the candidate is invalid.
    std::optional<InvalidIdReason> reason;

    [[nodiscard]] bool valid() const noexcept { return type.has_value(); }
};

/// @brief Overall validation summary.
struct ValidationSummary {
    std::uint32_t total = 0;
    std::uint32_t valid = 0;
    std::uint32_t invalid = 0;
    std::uint32_t citizens = 0;
    std::uint32_t residents = 0;

    std::vector<CandidateResult> results;

    /// @brief True when every candidate was valid.
    [[nodiscard]] bool passed() const noexcept { return invalid == 0; }

    void addResult(CandidateResult result) {
        ++total;
        if (result.valid()) {
            ++valid;
            if (*result.type == core::IdType::kCitizen) {
                ++citizens;
            } else {
                ++residents;
            }
        } else {
            ++invalid;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Validate Options
// =============================================================================

/// @brief Configuration options for validate command.
struct ValidateOptions {
    /// @brief Candidates given on the command line.
    std::vector<std::string> candidates;

    /// @brief File with one candidate per line, "-" for stdin. Empty for none.
    std::filesystem::path inputPath;

    /// @brief Stop at the first invalid candidate.
    bool failFast = false;
};

// =============================================================================
// ValidateCommand Class
// =============================================================================

/// @brief Command handler for validating identifiers.
class ValidateCommand {
public:
    explicit ValidateCommand(ValidateOptions options);

    ~ValidateCommand();

    // Non-copyable, movable
    ValidateCommand(const ValidateCommand&) = delete;
    ValidateCommand& operator=(const ValidateCommand&) = delete;
    ValidateCommand(ValidateCommand&&) noexcept;
    ValidateCommand& operator=(ValidateCommand&&) noexcept;

    /// @brief Execute against the process streams.
    /// @return Exit code (0 = all valid).
    [[nodiscard]] int execute();

    /// @brief Execute with explicit streams.
    /// @param in Stream read when inputPath is "-".
    /// @param out Stream receiving one result line per candidate, then the summary line.
    /// @return Exit code: kSuccess, kInvalidId, kIOError or kUsageError.
    [[nodiscard]] int execute(std::istream& in, std::ostream& out);

    [[nodiscard]] const ValidationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const ValidateOptions& options() const noexcept { return options_; }

private:
    /// @brief Gather candidates from arguments and the input file.
    /// @throws IOError if the input file cannot be opened.
    [[nodiscard]] std::vector<std::string> collectCandidates(std::istream& in) const;

    /// @brief Validate one candidate and print its result line.
    [[nodiscard]] CandidateResult validateOne(const std::string& text, std::ostream& out) const;

    ValidateOptions options_;
    ValidationSummary summary_;
};

/// @brief Render the summary line, e.g. "3 checked: 2 valid (1 citizen, 1 resident), 1 invalid".
[[nodiscard]] std::string formatSummary(const ValidationSummary& summary);

/// @brief Read candidates from a stream, one per line.
/// @note Surrounding whitespace is trimmed; blank lines are skipped.
[[nodiscard]] std::vector<std::string> readCandidates(std::istream& in);

}  // namespace sid::commands

#endif  // SID_COMMANDS_VALIDATE_COMMAND_H
