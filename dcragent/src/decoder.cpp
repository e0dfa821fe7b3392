
#include "decoder.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool NdjsonDecoder::decode_line(const std::string& line, Report& report) {
    auto trimmed = util::trim(line);
    if (trimmed.empty()) {
        return false;
    }

    if (trimmed.front() == '(') {
        // gpsmon chatter
        spdlog::debug("Producer: {}", trimmed);
        return false;
    }

    if (trimmed.front() != '{') {
        throw DecodeError("unexpected producer output: " + trimmed.substr(0, 80));
    }

    try {
        report = Report::from_json(json::parse(trimmed));
    } catch (const json::exception& e) {
        throw DecodeError(std::string("malformed report: ") + e.what());
    }
    return true;
}

void NdjsonDecoder::decode_stream(ByteStream& stream,
                                  const std::string& source_type,
                                  const ReportCallback& on_report) {
    if (source_type != "ndjson") {
        throw DecodeError("unsupported source type: " + source_type);
    }

    std::string pending;
    char buffer[4096];

    auto flush_line = [&](const std::string& line) {
        Report report;
        if (decode_line(line, report)) {
            on_report(report);
        }
    };

    for (;;) {
        size_t n = stream.read(buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        pending.append(buffer, n);

        size_t start = 0;
        size_t pos;
        while ((pos = pending.find('\n', start)) != std::string::npos) {
            flush_line(pending.substr(start, pos - start));
            start = pos + 1;
        }
        pending.erase(0, start);

        if (pending.size() > kMaxLineLength) {
            throw DecodeError("producer line exceeds " + std::to_string(kMaxLineLength) + " bytes");
        }
    }

    // Unterminated last line
    if (!pending.empty()) {
        flush_line(pending);
    }
}

std::unique_ptr<Decoder> make_decoder(const std::string& source_type) {
    if (source_type == "ndjson") {
        return std::make_unique<NdjsonDecoder>();
    }
    throw ConfigError("Unsupported source type: " + source_type);
}
