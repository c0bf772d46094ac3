#include "CliOptions.hpp"
#include "requirements.hpp"
#include <ostream>


void print_help(std::ostream& os) {
    os << "Usage:\n"
       << "  ./secure_redactor [file]             Redact file (or piped stdin) to stdout\n"
       << "  ./secure_redactor [file] -o OUT      Write redacted content to OUT\n"
       << "  ./secure_redactor -c, --config FILE  Load JSON config (default: $SECURE_REDACTOR_CONFIG)\n"
       << "  ./secure_redactor -h, --help         Show this help message\n"
       << "With no file and no pipe, a built-in demo text is redacted.\n";
}

// Desc: parse command line arguments
// In: int argc, const char* const* argv, CliOptions& out, std::string& err
// Out: bool (false on usage error)
bool parse_cli(int argc, const char* const* argv, CliOptions& out, std::string& err) {
    out = CliOptions{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            out.show_help = true;
            return true;
        }
        if (arg == "-o" || arg == "--output" || arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) { err = "option " + arg + " requires a value"; return false; }
            const std::string val = argv[++i];
            if (arg == "-o" || arg == "--output") out.run.output_path = val;
            else { out.config_path = val; out.have_config = true; }
            continue;
        }
        if (arg.rfind("--output=", 0) == 0) { out.run.output_path = arg.substr(9); continue; }
        if (arg.rfind("--config=", 0) == 0) { out.config_path = arg.substr(9); out.have_config = true; continue; }
        if (arg.size() > 1 && arg[0] == '-') { err = "unknown option: " + arg; return false; }
        if (!out.run.input_path.empty()) { err = "unexpected argument: " + arg; return false; }
        out.run.input_path = arg;
    }
    return true;
}

std::string resolve_config_path(const CliOptions& opts, const char* env_config) {
    if (opts.have_config) return opts.config_path;
    return env_config ? std::string(env_config) : std::string();
}

// Desc: full command flow behind main()
// In: int argc, const char* const* argv, const char* env_config, const EngineStreams& io
// Out: int (exit status)
int run_cli(int argc, const char* const* argv, const char* env_config, const EngineStreams& io) {
    CliOptions opts;
    std::string err;
    if (!parse_cli(argc, argv, opts, err)) {
        io.err << "[Main] " << err << "\n";
        print_help(io.err);
        return 2;
    }
    if (opts.show_help) {
        print_help(io.out);
        return 0;
    }

    auto boot = Requirements::run(resolve_config_path(opts, env_config));
    if (!boot.ok) {
        io.err << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    return run_core_engine(opts.run, boot.config, io);
}
