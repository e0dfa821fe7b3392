#pragma once

#include "types.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

// Raw producer output. read() blocks and returns 0 once the producer has
// closed its end.
class ByteStream {
public:
    virtual ~ByteStream() = default;
    virtual size_t read(char* buffer, size_t length) = 0;
};

using ReportCallback = std::function<void(const Report&)>;

// Turns a producer byte stream into reports. decode_stream() returns at end
// of stream and throws DecodeError when the stream cannot be decoded.
// Exceptions thrown by on_report propagate unchanged.
class Decoder {
public:
    virtual ~Decoder() = default;

    virtual void decode_stream(ByteStream& stream,
                               const std::string& source_type,
                               const ReportCallback& on_report) = 0;
};

// One JSON report per line. Blank lines and gpsmon status lines of the form
// "(<length>) <payload>" are skipped.
class NdjsonDecoder : public Decoder {
public:
    static constexpr size_t kMaxLineLength = 1 << 20;

    void decode_stream(ByteStream& stream,
                       const std::string& source_type,
                       const ReportCallback& on_report) override;

    // Returns false when the line carries no report
    static bool decode_line(const std::string& line, Report& report);
};

// Throws ConfigError for unsupported source types
std::unique_ptr<Decoder> make_decoder(const std::string& source_type);
