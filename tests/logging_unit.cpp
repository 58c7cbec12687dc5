// Logging helpers: verbosity parsing and filtering, tag severities, hex preview.
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "fourcc.hpp"
#include "logging.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[logging_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Redirects std::cerr into a buffer for the lifetime of the object.
class CerrCapture {
   public:
    CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

   private:
    std::ostringstream buffer_;
    std::streambuf *old_;
};

bool test_parse_verbosity() {
    using fourcc::LogVerbosity;
    bool ok = check(fourcc::parse_log_verbosity("debug") == LogVerbosity::Debug, "debug");
    ok &= check(fourcc::parse_log_verbosity("warning") == LogVerbosity::Warn, "warning alias");
    ok &= check(fourcc::parse_log_verbosity("error") == LogVerbosity::Error, "error");
    ok &= check(!fourcc::parse_log_verbosity("loud"), "unknown level rejected");
    return ok;
}

bool test_tag_severity() {
    using fourcc::LogVerbosity;
    static_assert(fourcc::severity_for_tag("error") == LogVerbosity::Error, "error tag");
    static_assert(fourcc::severity_for_tag("io") == LogVerbosity::Debug, "component tag");
    bool ok = check(fourcc::severity_for_tag("warn") == LogVerbosity::Warn, "warn tag");
    ok &= check(fourcc::severity_for_tag("info") == LogVerbosity::Info, "info tag");
    return ok;
}

bool test_filtering() {
    bool ok = true;
    {
        fourcc::set_log_verbosity(fourcc::LogVerbosity::Warn);
        CerrCapture capture;
        FC_LOG("info", "hidden " << 1);
        FC_LOG("text", "hidden debug");
        FC_LOG("warn", "shown " << fourcc::FourCC("RGBA"));
        ok &= check(capture.str() == "[FourCC][warn] shown 'RGBA'\n", "warn passes, info drops");
    }
    {
        fourcc::set_log_verbosity(fourcc::LogVerbosity::Debug);
        CerrCapture capture;
        auto rejected = fourcc::FourCC::try_from_text("abc");
        ok &= check(!rejected, "try_from_text rejects short text");
        ok &= check(capture.str().find("[FourCC][text] rejecting fourcc text of 3 bytes") !=
                        std::string::npos,
                    "debug log emitted for rejected text");
    }
    {
        fourcc::set_log_verbosity(fourcc::LogVerbosity::Error);
        CerrCapture capture;
        FC_LOG("error", "boom");
        const std::string out = capture.str();
        ok &= check(out.rfind("[FourCC][error][", 0) == 0, "error prefix");
        ok &= check(out.find("logging_unit.cpp:") != std::string::npos, "error carries location");
        ok &= check(out.find("] boom\n") != std::string::npos, "error message");
    }
    fourcc::set_log_verbosity(fourcc::LogVerbosity::Info);
    return ok;
}

bool test_hex_prefix() {
    using fourcc::hex_prefix;
    bool ok = check(hex_prefix({}).empty(), "no bytes, no preview");
    const fourcc::FourCC tag(fourcc::TypeId{'f', 't', 0x00, 0x9C});
    const std::vector<uint8_t> bytes(tag.bytes().begin(), tag.bytes().end());
    ok &= check(hex_prefix(bytes) == "66 74 00 9c", "tag bytes as lowercase hex pairs");
    ok &= check(hex_prefix(bytes, 1) == "66", "single byte preview has no separator");

    std::vector<uint8_t> header(fourcc::kHexPreviewBytes + 4, 0xEE);
    const std::string preview = hex_prefix(header);
    ok &= check(preview.size() == fourcc::kHexPreviewBytes * 3 - 1,
                "default preview stops at kHexPreviewBytes");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_parse_verbosity();
    ok &= test_tag_severity();
    ok &= test_filtering();
    ok &= test_hex_prefix();
    return ok ? 0 : 1;
}
