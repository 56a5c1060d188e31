#include <charconv>
#include <cstdio>
#include <format>
#include <fstream>
#include <optional>
#include <print>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <glog/logging.h>

#include "glint.hpp"

using namespace glint;

namespace {

    struct Options {
        std::string path{};
        std::vector<LabeledSpan> labels{};
        std::string message{};
        bool ascii{false};
        bool narrate{false};
        std::optional<dsize_t> context{};
        std::optional<dsize_t> width{};
    };

    auto usage(char const* program) -> void {
        std::println(stderr, "usage: {} FILE OFFSET:LENGTH[:LABEL]... [--ascii] [--narrate] [--context N] [--width N] [--message TEXT]", program);
    }

    auto parse_number(std::string_view text) -> std::optional<dsize_t> {
        auto value = dsize_t{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) return {};
        return value;
    }

    // OFFSET:LENGTH[:LABEL]; the label may itself contain ':'.
    auto parse_label(std::string_view text) -> std::optional<LabeledSpan> {
        auto const first = text.find(':');
        if (first == std::string_view::npos) return {};

        auto const rest = text.substr(first + 1);
        auto const second = rest.find(':');

        auto offset = parse_number(text.substr(0, first));
        auto length = parse_number(rest.substr(0, second));
        if (!offset || !length) return {};

        auto res = LabeledSpan::underline(SourceSpan(*offset, *length));
        if (second != std::string_view::npos) res.label = std::string(rest.substr(second + 1));
        return res;
    }

    auto parse_options(int argc, char** argv) -> std::optional<Options> {
        auto res = Options{};
        for (auto i = 1; i < argc; ++i) {
            auto arg = std::string_view(argv[i]);

            if (arg == "--ascii") {
                res.ascii = true;
            } else if (arg == "--narrate") {
                res.narrate = true;
            } else if (arg == "--context" || arg == "--width" || arg == "--message") {
                if (i + 1 >= argc) {
                    LOG(ERROR) << "missing value for " << arg;
                    return {};
                }
                auto value = std::string_view(argv[++i]);
                if (arg == "--message") {
                    res.message = value;
                    continue;
                }
                auto number = parse_number(value);
                if (!number) {
                    LOG(ERROR) << "invalid number '" << value << "' for " << arg;
                    return {};
                }
                (arg == "--context" ? res.context : res.width) = *number;
            } else if (res.path.empty()) {
                res.path = arg;
            } else {
                auto label = parse_label(arg);
                if (!label) {
                    LOG(ERROR) << "invalid label '" << arg << "', expected OFFSET:LENGTH[:LABEL]";
                    return {};
                }
                res.labels.push_back(std::move(*label));
            }
        }

        if (res.path.empty()) {
            LOG(ERROR) << "no input file given";
            return {};
        }
        return res;
    }

    auto read_file(std::string const& path) -> std::optional<std::string> {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file) return {};
        auto buffer = std::stringstream();
        buffer << file.rdbuf();
        return std::move(buffer).str();
    }

} // namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    auto options = parse_options(argc, argv);
    if (!options) {
        usage(argv[0]);
        return 1;
    }

    auto text = read_file(options->path);
    if (!text) {
        LOG(ERROR) << "cannot read '" << options->path << "'";
        return 1;
    }

    auto config = RenderConfig::from_terminal(stdout);
    if (options->ascii) config.glyphs = core::term::glyphs::ascii;
    if (options->context) {
        config.context_lines_before = *options->context;
        config.context_lines_after = *options->context;
    }
    if (options->width) config.terminal_width = *options->width;

    LOG(INFO) << "rendering " << options->labels.size() << " label(s) over " << options->path;

    auto diagnostic = Diagnostic {
        .severity = Severity::Advice,
        .message = options->message.empty()
            ? std::format("{} annotated span(s)", options->labels.size())
            : options->message,
        .source = Source { .name = options->path, .text = std::move(*text) },
        .labels = std::move(options->labels)
    };

    auto term = Terminal(stdout);
    if (options->narrate) {
        NarratableReportHandler{ config }.render_report(term, diagnostic);
    } else {
        GraphicalReportHandler{ config }.render_report(term, diagnostic);
    }
    term.flush();
    return 0;
}
