// =============================================================================
// saudi-id - Validate Command Implementation
// =============================================================================

#include "validate_command.h"

#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string_view>

#include "sid/common/logger.h"

namespace sid::commands {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

}  // namespace

std::vector<std::string> readCandidates(std::istream& in) {
    std::vector<std::string> candidates;
    std::string line;
    while (std::getline(in, line)) {
        auto trimmed = trim(line);
        if (!trimmed.empty()) {
            candidates.emplace_back(trimmed);
        }
    }
    return candidates;
}

std::string formatSummary(const ValidationSummary& summary) {
    return std::format("{} checked: {} valid ({} citizen, {} resident), {} invalid", summary.total,
                       summary.valid, summary.citizens, summary.residents, summary.invalid);
}

// =============================================================================
// ValidateCommand Implementation
// =============================================================================

ValidateCommand::ValidateCommand(ValidateOptions options) : options_(std::move(options)) {}

ValidateCommand::~ValidateCommand() = default;

ValidateCommand::ValidateCommand(ValidateCommand&&) noexcept = default;
ValidateCommand& ValidateCommand::operator=(ValidateCommand&&) noexcept = default;

int ValidateCommand::execute() {
    return execute(std::cin, std::cout);
}

int ValidateCommand::execute(std::istream& in, std::ostream& out) {
    summary_ = ValidationSummary{};

    try {
        const auto candidates = collectCandidates(in);
        if (candidates.empty()) {
            throw UsageError("no ids to validate (pass ids as arguments or use --input)");
        }

        SID_LOG_DEBUG("Validating {} candidate(s)", candidates.size());

        for (const auto& text : candidates) {
            auto result = validateOne(text, out);
            const bool stop = !result.valid() && options_.failFast;
            summary_.addResult(std::move(result));
            if (stop) {
                SID_LOG_DEBUG("Stopping at first invalid id (--fail-fast)");
                break;
            }
        }

        const std::string line = formatSummary(summary_);
        out << line << '\n';
        SID_LOG_INFO("{}", line);

        return summary_.passed() ? toExitCode(ErrorCode::kSuccess)
                                 : toExitCode(ErrorCode::kInvalidId);
    } catch (const SIDException& e) {
        SID_LOG_ERROR("Validation failed: {}", e.what());
        return e.exitCode();
    }
}

std::vector<std::string> ValidateCommand::collectCandidates(std::istream& in) const {
    std::vector<std::string> candidates = options_.candidates;

    if (options_.inputPath.empty()) {
        return candidates;
    }

    std::vector<std::string> fromInput;
    if (options_.inputPath == "-") {
        fromInput = readCandidates(in);
    } else {
        std::ifstream file(options_.inputPath);
        if (!file) {
            throw IOError("Cannot open input file: " + options_.inputPath.string());
        }
        fromInput = readCandidates(file);
        if (file.bad()) {
            throw IOError("Failed reading input file: " + options_.inputPath.string());
        }
    }

    if (fromInput.empty()) {
        SID_LOG_WARNING("No ids found in input '{}'", options_.inputPath.string());
    }

    candidates.insert(candidates.end(), std::make_move_iterator(fromInput.begin()),
                      std::make_move_iterator(fromInput.end()));
    return candidates;
}

CandidateResult ValidateCommand::validateOne(const std::string& text, std::ostream& out) const {
    CandidateResult result;
    result.text = text;

    auto id = core::Id::parse(text);
    if (id) {
        result.type = id->type();
        out << text << "\tvalid\t" << core::idTypeToString(*result.type) << '\n';
        SID_LOG_TRACE("Accepted '{}'", text);
    } else {
        result.reason = id.error().reason();
        out << text << "\tinvalid\t" << invalidIdReasonToString(*result.reason) << '\n';
        SID_LOG_DEBUG("Rejected '{}': {}", text, id.error().message());
    }
    return result;
}

}  // namespace sid::commands
