#include "runner.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <sys/stat.h>

namespace minimap {

namespace {

constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

Result read_stream(std::FILE* f, std::string& data) {
    char buf[READ_BUFFER_SIZE];
    while (true) {
        size_t n = std::fread(buf, 1, sizeof(buf), f);
        data.append(buf, n);
        if (n < sizeof(buf)) {
            if (std::ferror(f)) {
                int err = errno;
                return Result::fail(ErrorCode::UNREADABLE_INPUT,
                                    err ? std::strerror(err) : "read error");
            }
            break;
        }
    }
    return Result::ok();
}

}

Result read_input(const std::string& path, std::string& data) {
    data.clear();

    if (path == "-") {
        errno = 0;
        return read_stream(stdin, data);
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return Result::fail(ErrorCode::UNREADABLE_INPUT, std::strerror(errno));
    }
    if (S_ISDIR(st.st_mode)) {
        return Result::fail(ErrorCode::UNREADABLE_INPUT, std::strerror(EISDIR));
    }

    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
        return Result::fail(ErrorCode::UNREADABLE_INPUT, std::strerror(errno));
    }
    if (S_ISREG(st.st_mode) && st.st_size > 0) {
        data.reserve(static_cast<size_t>(st.st_size));
    }
    errno = 0;
    Result r = read_stream(f, data);
    std::fclose(f);
    return r;
}

Runner::Runner(const Pipeline& pipeline, const LanguageResolver& resolver, Terminal& term,
               std::ostream& err, Options options)
    : pipeline_(pipeline),
      resolver_(resolver),
      term_(term),
      err_(err),
      options_(std::move(options)) {}

void Runner::report_error(const std::string& name, const std::string& cause) {
    err_ << "Error: " << name << ": " << cause << "\n";
}

void Runner::report_warning(const std::string& name, const std::string& cause) {
    if (!options_.verbose) return;
    err_ << "Warning: " << name << ": " << cause << "\n";
}

Result Runner::render_source(const std::string& name, std::string_view data, std::string& out) {
    ResolveRequest request;
    request.override_name = options_.language;
    if (name != STDIN_NAME) {
        request.filename = name;
    }
    request.head = data;

    Resolution resolution;
    Result r = resolver_.resolve(request, resolution);
    if (r.error == ErrorCode::UNKNOWN_LANGUAGE) {
        return r;
    }
    if (r.error == ErrorCode::UNDETERMINED_LANGUAGE) {
        report_warning(name, "could not determine language, rendering as plain text");
    }

    Pipeline::Stats stats = pipeline_.render(data, *resolution.language, out);
    if (stats.classifier_fallback) {
        report_warning(name, "highlighting failed (" + stats.fallback_reason +
                                 "), rendered without syntax colors");
    }
    return Result::ok();
}

Result Runner::write_chunked(const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        size_t len = std::min(FLUSH_CHUNK, data.size() - offset);
        Result r = term_.write(data.substr(offset, len));
        if (r.failure()) return r;
        offset += len;
    }
    return term_.flush();
}

int Runner::run(const std::vector<std::string>& inputs) {
    std::vector<std::string> paths = inputs;
    if (paths.empty()) {
        paths.emplace_back("-");
    }

    int status = EXIT_OK;
    std::string data;
    std::string out;

    for (const std::string& path : paths) {
        const std::string name = path == "-" ? std::string(STDIN_NAME) : path;

        Result r = read_input(path, data);
        if (r.failure()) {
            report_error(name, r.message);
            status = EXIT_FAILURE_INPUT;
            continue;
        }

        out.clear();
        r = render_source(name, data, out);
        if (r.failure()) {
            report_error(name, r.message);
            status = EXIT_FAILURE_INPUT;
            continue;
        }

        r = write_chunked(out);
        if (r.error == ErrorCode::BROKEN_PIPE) {
            return status;
        }
        if (r.failure()) {
            report_error("stdout", r.message);
            return EXIT_FAILURE_INPUT;
        }
    }

    return status;
}

}
