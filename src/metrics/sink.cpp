#include "metrics/sink.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace cloner::metrics {

FileMetricsSink::FileMetricsSink(std::string path) : path_(std::move(path)) {}

Result FileMetricsSink::Publish(const Registry& registry) {
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os.good()) {
            return Result::Fail(ErrorKind::WriteError, -1, "cannot open " + tmp_path);
        }
        os << registry.Serialize();
        os.close();
        if (!os.good()) {
            return Result::Fail(ErrorKind::WriteError, -1, "cannot write " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::WriteError,
                            e,
                            "rename " + tmp_path + " -> " + path_ + ": " + std::strerror(e));
    }
    return Result::Ok();
}

} // namespace cloner::metrics
