#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "async/Task.h"
#include "common/Assert.h"
#include "common/Log.h"
#include "common/StreamError.h"
#include "io/FdChunkSource.h"
#include "json/JsonValue.h"
#include "stream/ArrayStreamReader.h"

using namespace jstream;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitDataError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitSourceFault = 3;

struct CliOptions {
    stream::StreamOptions stream;
    io::FdChunkSourceOptions source;
    std::string path;
    log::level::level_enum level = log::level::warn;
};

void print_usage(const char *program) {
    std::cerr << "Usage: " << program << " [options] [FILE]\n\n"
              << "Prints each element of the top-level JSON array in FILE (or stdin)\n"
              << "as one line of compact JSON.\n\n"
              << "Options:\n"
              << "  --comments=disallow|skip|allow  Comment handling (default: disallow)\n"
              << "  --trailing-commas               Accept trailing commas\n"
              << "  --max-depth=N                   Maximum nesting depth (default: 64)\n"
              << "  --buffer-capacity=N             Initial element buffer slots (default: 32)\n"
              << "  --read-size=N                   Bytes per read(2) call (default: 16384)\n"
              << "  --require-array                 Reject input that does not start with an array\n"
              << "  --verbose                       Log stream progress to stderr\n"
              << "  --quiet                         Log only errors\n";
}

std::optional<std::size_t> parse_size(std::string_view text) {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<json::CommentHandling> parse_comments(std::string_view text) {
    if (text == "disallow") {
        return json::CommentHandling::Disallow;
    }
    if (text == "skip") {
        return json::CommentHandling::Skip;
    }
    if (text == "allow") {
        return json::CommentHandling::Allow;
    }
    return std::nullopt;
}

// Returns an error message on failure.
std::optional<std::string> parse_args(int argc, char **argv, CliOptions &out) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value_of = [&](std::string_view prefix) -> std::optional<std::string_view> {
            if (arg.starts_with(prefix)) {
                return arg.substr(prefix.size());
            }
            return std::nullopt;
        };
        if (arg == "--trailing-commas") {
            out.stream.reader.allow_trailing_commas = true;
        } else if (arg == "--require-array") {
            out.stream.require_array = true;
        } else if (arg == "--verbose") {
            out.level = log::level::debug;
        } else if (arg == "--quiet") {
            out.level = log::level::err;
        } else if (auto v = value_of("--comments=")) {
            auto handling = parse_comments(*v);
            if (!handling) {
                return "invalid --comments value: " + std::string(*v);
            }
            out.stream.reader.comment_handling = *handling;
        } else if (auto v = value_of("--max-depth=")) {
            auto depth = parse_size(*v);
            if (!depth || *depth == 0) {
                return "invalid --max-depth value: " + std::string(*v);
            }
            out.stream.reader.max_depth = *depth;
        } else if (auto v = value_of("--buffer-capacity=")) {
            auto capacity = parse_size(*v);
            if (!capacity || *capacity == 0) {
                return "invalid --buffer-capacity value: " + std::string(*v);
            }
            out.stream.initial_buffer_capacity = *capacity;
        } else if (auto v = value_of("--read-size=")) {
            auto size = parse_size(*v);
            if (!size || *size == 0) {
                return "invalid --read-size value: " + std::string(*v);
            }
            out.source.read_size = *size;
        } else if (arg == "-" || !arg.starts_with("-")) {
            if (!out.path.empty()) {
                return "more than one input file";
            }
            out.path = std::string(arg);
        } else {
            return "unknown option: " + std::string(arg);
        }
    }
    return std::nullopt;
}

async::Task<std::size_t> print_elements(io::ChunkSource &source, stream::StreamOptions options) {
    stream::ArrayReadParams<json::JsonValue> params;
    params.options = options;
    auto elements = stream::read_array<json::JsonValue>(source, std::move(params));
    std::size_t count = 0;
    std::string line;
    while (true) {
        auto item = co_await elements.next();
        if (!item) {
            co_return std::unexpected(std::move(item.error()));
        }
        if (!*item) {
            break;
        }
        line = json::to_json(**item);
        line.push_back('\n');
        std::fwrite(line.data(), 1, line.size(), stdout);
        count += 1;
    }
    co_return count;
}

int exit_code_for(const common::StreamError &error) {
    switch (error.code) {
        case common::StreamErr::Syntax:
        case common::StreamErr::Decode:
            return kExitDataError;
        case common::StreamErr::SourceFault:
            return kExitSourceFault;
        default:
            return kExitDataError;
    }
}

} // namespace

int main(int argc, char **argv) {
    CliOptions options;
    if (auto error = parse_args(argc, argv, options)) {
        std::cerr << argv[0] << ": " << *error << "\n\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    log::set_default_logger(log::stderr_color_mt("jstream"));
    log::set_level(options.level);

    int fd = STDIN_FILENO;
    bool owns_fd = false;
    if (!options.path.empty() && options.path != "-") {
        fd = ::open(options.path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            int err = errno;
            log::error("cannot open {}: {}", options.path, std::strerror(err));
            return kExitSourceFault;
        }
        owns_fd = true;
    }

    io::FdChunkSource source(fd, options.source);
    async::Task<std::size_t> task = print_elements(source, options.stream);
    task.start();
    JSTREAM_ASSERT_MSG(task.done(), "descriptor reads complete synchronously");
    auto result = task.result();
    std::fflush(stdout);
    if (owns_fd) {
        ::close(fd);
    }

    if (!result) {
        log::error("{}", common::describe(result.error()));
        return exit_code_for(result.error());
    }
    log::info("{} elements", *result);
    return kExitOk;
}
