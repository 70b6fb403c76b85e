// =============================================================================
// saudi-id - Generate Command Implementation
// =============================================================================

#include "generate_command.h"

#include <format>
#include <iostream>
#include <random>
#include <unordered_set>

#include "sid/algo/luhn.h"
#include "sid/common/logger.h"

namespace sid::commands {

GenerateCommand::GenerateCommand(GenerateOptions options) : options_(std::move(options)) {}

GenerateCommand::~GenerateCommand() = default;

GenerateCommand::GenerateCommand(GenerateCommand&&) noexcept = default;
GenerateCommand& GenerateCommand::operator=(GenerateCommand&&) noexcept = default;

int GenerateCommand::execute() {
    return execute(std::cout);
}

int GenerateCommand::execute(std::ostream& out) {
    try {
        validateOptions();

        const std::uint64_t seed = options_.seed.value_or(std::random_device{}());
        algo::luhn::Engine engine{seed};
        SID_LOG_DEBUG("Generating {} {} id(s) with seed {}", options_.count,
                      core::idTypeToString(options_.type), seed);

        generated_.clear();
        generated_.reserve(options_.count);

        std::unordered_set<core::Id> seen;
        std::size_t duplicates = 0;
        while (generated_.size() < options_.count) {
            auto id = core::Id::generate(options_.type, engine);
            if (options_.unique && !seen.insert(id).second) {
                ++duplicates;
                continue;
            }
            out << id << '\n';
            generated_.push_back(std::move(id));
        }

        if (duplicates > 0) {
            SID_LOG_DEBUG("Discarded {} duplicate id(s)", duplicates);
        }
        SID_LOG_INFO("Generated {} {} id(s)", generated_.size(),
                     core::idTypeToString(options_.type));
        return toExitCode(ErrorCode::kSuccess);
    } catch (const SIDException& e) {
        SID_LOG_ERROR("Generation failed: {}", e.what());
        return e.exitCode();
    }
}

void GenerateCommand::validateOptions() const {
    if (options_.count == 0 || options_.count > kMaxGenerateCount) {
        throw UsageError(std::format("count must be between 1 and {}, got {}",
                                     kMaxGenerateCount, options_.count));
    }
}

}  // namespace sid::commands
