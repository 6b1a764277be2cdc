#include "cloner/channel.hpp"

#include "io/named_pipe_reader.hpp"

namespace cloner {

Result NamedPipeChannel::Open(std::unique_ptr<IReader>& out) {
    auto reader = std::make_unique<NamedPipeReader>();
    if (auto r = NamedPipeReader::Open(path_, *reader); !r.ok) return r;
    out = std::move(reader);
    return Result::Ok();
}

} // namespace cloner
