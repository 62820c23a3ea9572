#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace shopagent::app::cli {

    using namespace shopagent::core::errors;
    using shopagent::protocol::RunRequest;

    namespace {

        constexpr const char* kUsage =
            "Usage: shop_agent run --task \"...\" [--plan-file F] [--catalog F] "
            "[--cwd D] [--max-steps N] [--simulate-race] [--verbose]";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> task;
            std::optional<std::string> plan_file;
            std::optional<std::string> catalog_file;
            std::optional<std::string> cwd;
            std::optional<std::string> max_steps;
            bool simulate_race = false;
            bool verbose = false;
        };

        AgentError missing_value(const std::string& flag) {
            return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        // Relative file paths are taken from the process working directory.
        Result<std::filesystem::path> existing_file(const std::string& value, const std::string& flag) {
            std::filesystem::path p(value);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return AgentError{ErrorCategory::Input, flag + " does not name an existing file: " + value, "invalid_path"};
            }
            return p;
        }

    } // namespace

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--task") {
                if (i + 1 < args.size()) raw.task = args[++i];
                else return missing_value("--task");
            } else if (args[i] == "--plan-file") {
                if (i + 1 < args.size()) raw.plan_file = args[++i];
                else return missing_value("--plan-file");
            } else if (args[i] == "--catalog") {
                if (i + 1 < args.size()) raw.catalog_file = args[++i];
                else return missing_value("--catalog");
            } else if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return missing_value("--cwd");
            } else if (args[i] == "--max-steps") {
                if (i + 1 < args.size()) raw.max_steps = args[++i];
                else return missing_value("--max-steps");
            } else if (args[i] == "--simulate-race") {
                raw.simulate_race = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        RunRequest req;
        req.verbose = raw.verbose;
        req.simulate_race = raw.simulate_race;

        if (!raw.task.has_value() || raw.task->find_first_not_of(" \t\r\n") == std::string::npos) {
            return AgentError{ErrorCategory::Input, "Must provide a non-empty --task", "missing_required_flag", kUsage};
        }
        req.task_description = raw.task.value();

        if (raw.plan_file) {
            auto plan = existing_file(raw.plan_file.value(), "--plan-file");
            if (is_error(plan)) return get_error(plan);
            req.plan_file = get_value(plan);
        }
        if (raw.catalog_file) {
            auto catalog = existing_file(raw.catalog_file.value(), "--catalog");
            if (is_error(catalog)) return get_error(catalog);
            req.catalog_file = get_value(catalog);
        }

        // Exception-free integer parsing
        if (raw.max_steps) {
            uint32_t steps = 0;
            const char* begin = raw.max_steps->data();
            const char* end = raw.max_steps->data() + raw.max_steps->size();
            auto [ptr, ec] = std::from_chars(begin, end, steps);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for --max-steps", "invalid_integer", "Provide a positive integer."};
            }
            if (steps == 0 || steps > 1000) {
                return AgentError{ErrorCategory::Input, "--max-steps out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            req.max_steps = steps;
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        return req;
    }

} // namespace shopagent::app::cli
