#include "clikit/global_flags.hpp"

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <cstdio>

namespace clikit {

void add_global_flags(CLI::App& app, GlobalOptions& opts) {
    app.add_flag("-v,--verbose", opts.verbose, "Increase output verbosity");
    app.add_flag("-q,--quiet", opts.quiet, "Suppress non-essential output");
    app.add_flag("--debug", opts.debug, "Enable debug mode with full diagnostics");
    app.add_option("-f,--format", opts.format, "Output format")
        ->check(CLI::IsMember({"table", "json", "plain"}));
    app.add_flag("--dry-run", opts.dry_run, "Preview actions without executing");
    app.add_flag("-V,--version", opts.version, "Show version and exit");
}

GlobalParseResult parse_global_flags(const std::vector<std::string>& args) {
    GlobalParseResult result;

    CLI::App app{"global flags"};
    app.set_help_flag();
    app.prefix_command();
    app.allow_extras();
    add_global_flags(app, result.options);

    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        app.parse(reversed);
    } catch (const CLI::ParseError& e) {
        result.error = e.what();
        return result;
    }

    result.remaining = app.remaining();
    result.ok = true;
    return result;
}

ExecutionContext make_execution_context(const GlobalOptions& opts) {
    auto format = parse_output_format(opts.format).value_or(OutputFormat::Table);
    ExecutionContext ctx(resolve_verbosity(opts.verbose, opts.quiet, opts.debug),
                         format, opts.dry_run);
    ctx.with_interactive(isatty(fileno(stdin)) != 0);
    return ctx;
}

} // namespace clikit
