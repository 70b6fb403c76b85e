// =============================================================================
// saudi-id - Generate Command
// =============================================================================
// Command handler for generating random valid identifiers.
//
// Generated ids are meant for test data. With a seed the output is fully
// reproducible; without one each run draws from std::random_device.
// =============================================================================

#ifndef SID_COMMANDS_GENERATE_COMMAND_H
#define SID_COMMANDS_GENERATE_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <vector>

#include "sid/common/error.h"
#include "sid/core/id.h"

namespace sid::commands {

/// @brief Largest batch a single invocation may request.
inline constexpr std::size_t kMaxGenerateCount = 1'000'000;

// =============================================================================
// Generate Options
// =============================================================================

/// @brief Configuration options for generate command.
struct GenerateOptions {
    /// @brief Category of the generated ids.
    core::IdType type = core::IdType::kCitizen;

    /// @brief Number of ids to print.
    std::size_t count = 1;

    /// @brief Engine seed; std::nullopt draws one from std::random_device.
    std::optional<std::uint64_t> seed;

    /// @brief Suppress duplicates within the batch.
    bool unique = false;
};

// =============================================================================
// GenerateCommand Class
// =============================================================================

/// @brief Command handler for generating identifiers.
class GenerateCommand {
public:
    explicit GenerateCommand(GenerateOptions options);

    ~GenerateCommand();

    // Non-copyable, movable
    GenerateCommand(const GenerateCommand&) = delete;
    GenerateCommand& operator=(const GenerateCommand&) = delete;
    GenerateCommand(GenerateCommand&&) noexcept;
    GenerateCommand& operator=(GenerateCommand&&) noexcept;

    /// @brief Execute against stdout.
    [[nodiscard]] int execute();

    /// @brief Execute, printing one id per line to out.
    /// @return Exit code (kSuccess or kUsageError).
    [[nodiscard]] int execute(std::ostream& out);

    /// @brief Ids produced by the last execute().
    [[nodiscard]] const std::vector<core::Id>& generated() const noexcept { return generated_; }

    [[nodiscard]] const GenerateOptions& options() const noexcept { return options_; }

private:
    /// @throws UsageError on an out-of-range count.
    void validateOptions() const;

    GenerateOptions options_;
    std::vector<core::Id> generated_;
};

}  // namespace sid::commands

#endif  // SID_COMMANDS_GENERATE_COMMAND_H
