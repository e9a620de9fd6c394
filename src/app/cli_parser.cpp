#include "cli_parser.hpp"
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace flowlaunch::app::cli {

    using namespace flowlaunch::core::errors;
    using flowlaunch::protocol::LaunchRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> pdk;
        std::optional<std::string> scl;
        std::optional<std::string> flow;
        std::optional<std::string> pdk_root;
        std::optional<std::string> run_tag;
        bool last_run = false;
        std::optional<std::string> from;
        std::optional<std::string> to;
        std::optional<std::string> initial_state;
        std::vector<std::string> overrides;
        std::vector<std::string> positionals;
    };

    namespace {

        enum class OptionId {
            Pdk,
            Scl,
            Flow,
            PdkRoot,
            RunTag,
            LastRun,
            From,
            To,
            InitialState,
            OverrideConfig
        };

        struct OptionSpec {
            const char* long_name;
            const char* short_name;  // nullptr when there is no short form
            OptionId id;
            bool takes_value;
        };

        constexpr OptionSpec kOptions[] = {
            {"--pdk", "-p", OptionId::Pdk, true},
            {"--scl", "-s", OptionId::Scl, true},
            {"--flow", "-f", OptionId::Flow, true},
            {"--pdk-root", nullptr, OptionId::PdkRoot, true},
            {"--run-tag", nullptr, OptionId::RunTag, true},
            {"--last-run", nullptr, OptionId::LastRun, false},
            {"--from", "-F", OptionId::From, true},
            {"--to", "-T", OptionId::To, true},
            {"--with-initial-state", "-I", OptionId::InitialState, true},
            {"--override-config", "-c", OptionId::OverrideConfig, true},
        };

        const OptionSpec* find_option(const std::string& name) {
            for (const auto& spec : kOptions) {
                if (name == spec.long_name ||
                    (spec.short_name != nullptr && name == spec.short_name)) {
                    return &spec;
                }
            }
            return nullptr;
        }

        void store(RawCliOptions& raw, const OptionId id, std::string value) {
            switch (id) {
                case OptionId::Pdk: raw.pdk = std::move(value); break;
                case OptionId::Scl: raw.scl = std::move(value); break;
                case OptionId::Flow: raw.flow = std::move(value); break;
                case OptionId::PdkRoot: raw.pdk_root = std::move(value); break;
                case OptionId::RunTag: raw.run_tag = std::move(value); break;
                case OptionId::From: raw.from = std::move(value); break;
                case OptionId::To: raw.to = std::move(value); break;
                case OptionId::InitialState: raw.initial_state = std::move(value); break;
                case OptionId::OverrideConfig: raw.overrides.push_back(std::move(value)); break;
                case OptionId::LastRun: raw.last_run = true; break;
            }
        }

    } // namespace

    Result<LaunchRequest> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: read the raw strings, stop at the first syntax error
        bool only_positionals = false;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (only_positionals || arg.size() < 2 || arg[0] != '-') {
                raw.positionals.push_back(arg);
                continue;
            }
            if (arg == "--") {
                only_positionals = true;
                continue;
            }

            std::string name = arg;
            std::optional<std::string> inline_value;
            if (arg.rfind("--", 0) == 0) {
                const auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    name = arg.substr(0, eq);
                    inline_value = arg.substr(eq + 1);
                }
            }

            const OptionSpec* spec = find_option(name);
            if (spec == nullptr) {
                return LaunchError{ErrorCategory::Input, "Unknown argument: " + name, "unknown_argument", "Run with --help to list the supported options."};
            }

            if (!spec->takes_value) {
                if (inline_value) {
                    return LaunchError{ErrorCategory::Input, name + " does not take a value", "unexpected_value"};
                }
                store(raw, spec->id, std::string());
                continue;
            }

            if (inline_value) {
                store(raw, spec->id, std::move(*inline_value));
            } else if (i + 1 < args.size()) {
                store(raw, spec->id, args[++i]);
            } else {
                return LaunchError{ErrorCategory::Input, "Missing value for " + name, "missing_value"};
            }
        }

        // 3. Validator Phase: collect every violation before anything else runs
        LaunchError violations{ErrorCategory::Input, "", "invalid_arguments"};
        auto add_violation = [&violations](const std::string& code, const std::string& message,
                                           const std::string& hint = "") {
            if (violations.details.empty()) {
                violations.message = message;
                violations.code = code;
                violations.hint = hint;
            }
            violations.details.push_back(message);
        };

        if (raw.run_tag.has_value() && raw.last_run) {
            add_violation("conflicting_flags", "--run-tag and --last-run are mutually exclusive.");
        }
        if (raw.positionals.empty()) {
            add_violation("missing_config_file", "Missing required argument: CONFIG_FILE",
                          "Usage: flowlaunch [OPTIONS] CONFIG_FILE");
        } else if (raw.positionals.size() > 1) {
            add_violation("unexpected_argument", "Unexpected extra argument: " + raw.positionals[1]);
        }
        if (raw.pdk.has_value() && raw.pdk->empty()) {
            add_violation("empty_value", "--pdk cannot be empty.");
        }
        if (raw.run_tag.has_value() && raw.run_tag->empty()) {
            add_violation("empty_value", "--run-tag cannot be empty.");
        }

        if (!violations.details.empty()) {
            return violations;
        }

        LaunchRequest req;
        if (raw.pdk) req.pdk = raw.pdk.value();
        req.scl = raw.scl;
        req.flow_name = raw.flow;
        if (raw.pdk_root) req.pdk_root = std::filesystem::path(raw.pdk_root.value());
        req.run_tag = raw.run_tag;
        req.resume_last = raw.last_run;
        req.from_step = raw.from;
        req.to_step = raw.to;
        if (raw.initial_state) req.initial_state_path = std::filesystem::path(raw.initial_state.value());
        req.config_overrides = std::move(raw.overrides);
        req.config_file = std::filesystem::path(raw.positionals.front());
        return req;
    }

    bool wants_help(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--") {
                return false;
            }
            if (arg == "--help" || arg == "-h") {
                return true;
            }
        }
        return false;
    }

    std::string usage(const std::string& program) {
        std::ostringstream out;
        out << "Usage: " << program << " [OPTIONS] CONFIG_FILE\n"
            << "\n"
            << "Options:\n"
            << "  -p, --pdk TEXT                  The process design kit to use. [default: sky130A]\n"
            << "  -s, --scl TEXT                  The standard cell library to use. [default: varies by PDK]\n"
            << "  -f, --flow TEXT                 The built-in flow to use.\n"
            << "      --pdk-root PATH             Override the PDK root folder.\n"
            << "      --run-tag TEXT              Name for this run. Mutually exclusive with --last-run.\n"
            << "      --last-run                  Resume the most recent run. Mutually exclusive with --run-tag.\n"
            << "  -F, --from STEP                 Start from the step with this id.\n"
            << "  -T, --to STEP                   Stop at the step with this id.\n"
            << "  -I, --with-initial-state PATH   Use this JSON file as the initial state.\n"
            << "  -c, --override-config KEY=VALUE Override a configuration variable for this run only.\n"
            << "                                  VALUE must be a valid JSON value. Repeatable.\n"
            << "  -h, --help                      Show this message and exit.\n";
        return out.str();
    }

} // namespace flowlaunch::app::cli
