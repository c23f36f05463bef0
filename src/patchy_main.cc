#include "apply/apply.hpp"
#include "config/config.hpp"
#include "edit/format_detect.hpp"
#include "edit/types.hpp"
#include "edit/validate.hpp"
#include "generate/diff_generate.hpp"
#include "util/log.hpp"

#include <getopt.h>
#include <unistd.h>

#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace patchy {

enum ExitCode {
    kExitApplied = 0,
    kExitUnitsFailed = 1,
    kExitError = 2,
};

enum class FileStatus {
    kOk,
    kStdin,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

FileStatus
check_file_status(const std::string& path) {
    if (path == "-") {
        return FileStatus::kStdin;
    }

    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
to_string(const FileStatus error_code) {
    switch (error_code) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kStdin:
            return "Standard input";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
    }
    return "Unknown error";
}

bool
read_file(const std::string& path, std::string& contents, std::string& error) {
    const auto status = check_file_status(path);
    if (status == FileStatus::kStdin) {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        contents = buffer.str();
        return true;
    } else if (status != FileStatus::kOk) {
        error = fmt::format("'{}': {}", path, to_string(status));
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = fmt::format("'{}': {}", path, strerror(errno));
        return false;
    }
    contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = fmt::format("'{}': read failed", path);
        return false;
    }
    return true;
}

bool
write_output(const std::string& path, const std::string& contents, std::string& error) {
    if (path.empty() || path == "-") {
        if (fwrite(contents.data(), 1, contents.size(), stdout) != contents.size()) {
            error = "could not write to standard output";
            return false;
        }
        return true;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = fmt::format("could not open '{}' for writing: {}", path, strerror(errno));
        return false;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out) {
        error = fmt::format("could not write '{}'", path);
        return false;
    }
    return true;
}

struct Reporter {
    bool color = false;

    void
    print(fmt::text_style style, const std::string& text) const {
        if (color) {
            fmt::print(stderr, style, "{}", text);
        } else {
            fmt::print(stderr, "{}", text);
        }
    }

    void
    error(const std::string& message) const {
        print(fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold, "error");
        fmt::print(stderr, ": {}\n", message);
    }

    void
    warning(const std::string& message) const {
        print(fmt::fg(fmt::terminal_color::yellow) | fmt::emphasis::bold, "warning");
        fmt::print(stderr, ": {}\n", message);
    }
};

void
report_outcome(const Reporter& reporter, const ApplyOutcome& outcome, EditFormat format) {
    const char* units = format == EditFormat::Unified ? "hunk" : "block";

    for (const auto& warning : outcome.warnings) {
        reporter.warning(warning);
    }
    for (const auto& error : outcome.errors) {
        reporter.error(error);
    }
    for (const auto& failed : outcome.failed_units) {
        if (!failed.snippet.empty()) {
            fmt::print(stderr, "  {} {}: {}\n", units, failed.index + 1, failed.snippet);
        }
    }
    for (const auto& record : outcome.telemetry) {
        fmt::print(stderr, "  {} {}: {} (confidence {:.2f}) at line {}\n", units, record.index + 1,
                   repr(record.strategy), record.confidence, record.line);
    }

    auto style = outcome.blocks_failed == 0 ? fmt::fg(fmt::terminal_color::green)
                 : outcome.blocks_applied == 0 ? fmt::fg(fmt::terminal_color::red)
                                               : fmt::fg(fmt::terminal_color::yellow);
    reporter.print(style, fmt::format("applied {} of {} {}{}", outcome.blocks_applied, outcome.blocks_total, units,
                                      outcome.blocks_total == 1 ? "" : "s"));
    fmt::print(stderr, ", {} failed\n", outcome.blocks_failed);
}

}  // namespace patchy

int
main(int argc, char* argv[]) {
    patchy::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format((R"(
Usage: {0} [options] file edit_file
       {0} -c edit_file
       {0} -g modified_file [-u] file

Apply search/replace blocks or a unified diff to a file. Use '-' to read the
edit text from standard input.

Options:
    -f, --format [format]        edit format: auto, search-replace, unified
    -s, --strict                 apply every edit or none of them
    -t, --telemetry              report the strategy that matched each edit
    -m, --strategies [a,b,...]   matching strategies, in order:
                                     exact, line_trimmed, whitespace_normalized,
                                     indentation_agnostic, fuzzy
    -z, --fuzzy-threshold [x]    minimum similarity for fuzzy matches (0 to 1)
    -F, --fuzz [n]               context lines a hunk may get wrong
    -o, --output [path]          write the result to path instead of stdout
    -i, --in-place               write the result back to file
    -c, --check                  validate the edit text only
    -g, --generate [modified]    print edits that turn file into modified
    -u, --unified                generate a unified diff instead of blocks
    -C, --context [n]            context lines for generated edits
    -v, --verbose                more logging, repeat for more
    -q, --quiet                  only log errors
        --no-color               never color the report
        --version                show program version and exit
    -h, --help                   show this help

Exit status: 0 when every edit applied, 1 when some failed, 2 on errors.
)"),
                                       argv[0]);

        help += "\nConfig directory:\n    " + patchy::config_get_directory() + "\n";

        if (!optional_error_message.empty()) {
            help += "\n" + optional_error_message + "\n";
        }
        fputs(help.c_str(), optional_error_message.empty() ? stdout : stderr);
    };

    auto parse_number = [](const char* text, double& value) {
        char* end = nullptr;
        errno = 0;
        value = std::strtod(text, &end);
        return errno == 0 && end != text && *end == '\0';
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        enum LongOnly { kNoColor = 256, kVersion };
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"format", required_argument, 0, 'f'},
                                               {"strict", no_argument, 0, 's'},
                                               {"telemetry", no_argument, 0, 't'},
                                               {"strategies", required_argument, 0, 'm'},
                                               {"fuzzy-threshold", required_argument, 0, 'z'},
                                               {"fuzz", required_argument, 0, 'F'},
                                               {"output", required_argument, 0, 'o'},
                                               {"in-place", no_argument, 0, 'i'},
                                               {"check", no_argument, 0, 'c'},
                                               {"generate", required_argument, 0, 'g'},
                                               {"unified", no_argument, 0, 'u'},
                                               {"context", required_argument, 0, 'C'},
                                               {"verbose", no_argument, 0, 'v'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {"no-color", no_argument, 0, kNoColor},
                                               {"version", no_argument, 0, kVersion},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hf:stm:z:F:o:icg:uC:vq", long_options, &option_index)) >= 0) {
            switch (c) {
                case kVersion:
                    opts.version = true;
                    return true;
                case 'h':
                    opts.help = true;
                    return true;
                case 'f':
                    opts.format = optarg;
                    break;
                case 's':
                    opts.strict = true;
                    break;
                case 't':
                    opts.telemetry = true;
                    break;
                case 'm': {
                    opts.strategies.clear();
                    std::stringstream list(optarg);
                    std::string name;
                    while (std::getline(list, name, ',')) {
                        if (!name.empty()) {
                            opts.strategies.push_back(name);
                        }
                    }
                } break;
                case 'z': {
                    if (!parse_number(optarg, opts.fuzzy_threshold)) {
                        show_help(fmt::format("error: invalid value for -z ({})", optarg));
                        return false;
                    }
                } break;
                case 'F':
                case 'C': {
                    double value = 0;
                    if (!parse_number(optarg, value) || value < 0) {
                        show_help(fmt::format("error: invalid value for -{} ({})", static_cast<char>(c), optarg));
                        return false;
                    }
                    (c == 'F' ? opts.max_fuzz : opts.context_lines) = static_cast<int64_t>(value);
                } break;
                case 'o':
                    opts.output_file = optarg;
                    break;
                case 'i':
                    opts.in_place = true;
                    break;
                case 'c':
                    opts.check = true;
                    break;
                case 'g':
                    opts.modified_file = optarg;
                    break;
                case 'u':
                    opts.unified_output = true;
                    break;
                case 'v':
                    opts.verbosity++;
                    break;
                case 'q':
                    opts.verbosity = -1;
                    break;
                case kNoColor:
                    opts.color = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        const int positional_count = in_argc - optind;
        const int expected = opts.check || !opts.modified_file.empty() ? 1 : 2;
        if (positional_count != expected) {
            show_help("error: wrong number of positional arguments");
            return false;
        }

        if (opts.check) {
            opts.edit_file = in_argv[optind];
        } else {
            opts.document_file = in_argv[optind];
            if (expected == 2) {
                opts.edit_file = in_argv[optind + 1];
            }
        }

        if (opts.in_place && !opts.output_file.empty()) {
            show_help("error: -i and -o are mutually exclusive");
            return false;
        }
        if (opts.in_place && opts.document_file == "-") {
            show_help("error: -i needs a file, not standard input");
            return false;
        }
        if (opts.document_file == "-" && opts.edit_file == "-") {
            show_help("error: only one input can come from standard input");
            return false;
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    patchy::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return patchy::kExitError;
    }

    if (opts.help) {
        show_help("");
        return patchy::kExitApplied;
    }
    if (opts.version) {
        fmt::print("version: {}\n", PATCHY_VERSION);
        fmt::print("vcs hash: {}\n", PATCHY_BUILD_HASH);
        return patchy::kExitApplied;
    }

    patchy::LogLevel level = patchy::log_level_from_string(opts.log_level).value_or(patchy::LogLevel::Warning);
    if (opts.verbosity < 0) {
        level = patchy::LogLevel::Error;
    } else if (opts.verbosity > 0) {
        int raised = static_cast<int>(level) + static_cast<int>(opts.verbosity);
        level = static_cast<patchy::LogLevel>(std::min(raised, static_cast<int>(patchy::LogLevel::Trace)));
    }
    patchy::log_set_level(level);

    patchy::Reporter reporter;
    reporter.color = opts.color && isatty(STDERR_FILENO) != 0;

    std::string error;

    if (opts.check) {
        std::string edit_text;
        if (!patchy::read_file(opts.edit_file, edit_text, error)) {
            reporter.error(error);
            return patchy::kExitError;
        }

        patchy::ValidationReport report;
        const bool valid = patchy::validate_edit(edit_text, report);
        for (const auto& warning : report.warnings) {
            reporter.warning(warning);
        }
        if (!valid) {
            reporter.error(report.error.message);
            return patchy::kExitError;
        }
        const char* units = *report.format == patchy::EditFormat::Unified ? "hunk" : "block";
        fmt::print(stderr, "valid {} edit, {} {}{}\n", repr(*report.format), report.unit_count, units,
                   report.unit_count == 1 ? "" : "s");
        return patchy::kExitApplied;
    }

    std::string document;
    if (!patchy::read_file(opts.document_file, document, error)) {
        reporter.error(error);
        return patchy::kExitError;
    }

    if (!opts.modified_file.empty()) {
        std::string modified;
        if (!patchy::read_file(opts.modified_file, modified, error)) {
            reporter.error(error);
            return patchy::kExitError;
        }

        std::string edits;
        if (opts.unified_output) {
            edits = patchy::create_unified_diff(document, modified, opts.document_file, opts.modified_file,
                                                opts.context_lines);
        } else {
            edits = patchy::create_search_replace_diff(document, modified, opts.context_lines);
        }
        if (!patchy::write_output(opts.output_file, edits, error)) {
            reporter.error(error);
            return patchy::kExitError;
        }
        return patchy::kExitApplied;
    }

    std::string edit_text;
    if (!patchy::read_file(opts.edit_file, edit_text, error)) {
        reporter.error(error);
        return patchy::kExitError;
    }

    patchy::ApplyOptions apply_options;
    if (!patchy::config_make_apply_options(opts, apply_options, error)) {
        show_help(fmt::format("error: {}", error));
        return patchy::kExitError;
    }

    patchy::ApplyOutcome outcome;
    patchy::EditError edit_error;
    patchy::EditFormat format = patchy::EditFormat::SearchReplace;
    bool parsed = false;
    if (opts.format == "auto") {
        parsed = patchy::apply_auto(document, edit_text, apply_options, outcome, edit_error);
        if (parsed) {
            patchy::detect_format(edit_text, format);
        }
    } else if (auto forced = patchy::edit_format_from_string(opts.format)) {
        format = *forced;
        parsed = patchy::apply_with_format(document, edit_text, format, apply_options, outcome, edit_error);
    } else {
        show_help(fmt::format("error: unknown format '{}'", opts.format));
        return patchy::kExitError;
    }

    if (!parsed) {
        reporter.error(fmt::format("{}: {}", repr(edit_error.kind), edit_error.message));
        return patchy::kExitError;
    }

    patchy::report_outcome(reporter, outcome, format);

    if (opts.in_place) {
        if (outcome.blocks_applied > 0 && !patchy::write_output(opts.document_file, outcome.content, error)) {
            reporter.error(error);
            return patchy::kExitError;
        }
    } else if (!patchy::write_output(opts.output_file, outcome.content, error)) {
        reporter.error(error);
        return patchy::kExitError;
    }

    return outcome.all_applied() ? patchy::kExitApplied : patchy::kExitUnitsFailed;
}
