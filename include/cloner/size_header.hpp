#pragma once

#include "cloner/channel.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace cloner {

// Phase one of the channel protocol: the payload size as 16 hex digits,
// no prefix, no separators, no newline.
inline constexpr std::size_t kSizeHeaderLength = 16;

std::expected<std::uint64_t, std::string> ParseSizeHeader(std::string_view text);

// Collects exactly kSizeHeaderLength bytes from in, stopping early only at
// end-of-stream.
Result ReadSizeHeader(IReader& in, std::uint64_t& out_total);

// Opens the channel, reads the header and closes the channel again on every
// path before returning.
Result ReadTotalSize(IChannel& channel, std::uint64_t& out_total);

} // namespace cloner
