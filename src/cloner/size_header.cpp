#include "cloner/size_header.hpp"

#include "util/logger.hpp"

#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <memory>

namespace cloner {

std::expected<std::uint64_t, std::string> ParseSizeHeader(std::string_view text) {
    if (text.size() != kSizeHeaderLength) {
        return std::unexpected("size header must be " + std::to_string(kSizeHeaderLength) +
                               " characters, got " + std::to_string(text.size()));
    }
    for (const char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::unexpected("size header is not hexadecimal: \"" + std::string(text) + "\"");
        }
    }

    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::unexpected("size header is not hexadecimal: \"" + std::string(text) + "\"");
    }
    return value;
}

Result ReadSizeHeader(IReader& in, std::uint64_t& out_total) {
    std::array<std::uint8_t, kSizeHeaderLength> buf{};
    size_t got = 0;

    while (got < buf.size()) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(buf.data() + got, buf.size() - got));
        if (n == 0) break;
        if (n < 0) {
            const int e = errno;
            if (e == ECANCELED) {
                return Result::Fail(ErrorKind::Cancelled, e, "Canceled while reading size header");
            }
            return Result::Fail(ErrorKind::ReadError,
                                e,
                                std::string("Failed to read size header (") + std::strerror(e) + ")");
        }
        got += static_cast<size_t>(n);
    }

    if (got != buf.size()) {
        return Result::Fail(ErrorKind::ShortHeaderError,
                            -1,
                            "Didn't read all bytes for size header: got " + std::to_string(got) +
                                " of " + std::to_string(buf.size()));
    }

    auto parsed = ParseSizeHeader(std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size()));
    if (!parsed) {
        return Result::Fail(ErrorKind::MalformedHeaderError, -1, parsed.error());
    }
    out_total = *parsed;
    return Result::Ok();
}

Result ReadTotalSize(IChannel& channel, std::uint64_t& out_total) {
    LogDebug("Reading total size from %s", channel.Name().c_str());

    std::unique_ptr<IReader> in;
    if (auto r = channel.Open(in); !r.ok) return r;

    auto res = ReadSizeHeader(*in, out_total);
    in.reset();
    return res;
}

} // namespace cloner
