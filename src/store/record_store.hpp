#pragma once

#include "data/errors.hpp"
#include "data/records.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

// ---------------------------------------------------------------------------
// RecordStore — narrow read-only interface over the persisted records.
// Every call is a complete, scoped read: implementations acquire and release
// their underlying handle inside the call. Failures throw StoreAccessError.
// ---------------------------------------------------------------------------
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::vector<Subject> subjects() const = 0;
    virtual std::vector<Sample> samples() const = 0;
    virtual std::vector<PopulationCount> population_counts() const = 0;

    // Identifies the content version being read. Two reads with the same
    // snapshot id return the same records.
    virtual std::string snapshot_id() const = 0;
};

namespace store_util {

// "<path>@<size>:<mtime ticks>" for a backing file.
inline std::string file_fingerprint(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) throw StoreAccessError("cannot stat " + path.string() + ": " + ec.message());
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) throw StoreAccessError("cannot stat " + path.string() + ": " + ec.message());
    return path.string() + "@" + std::to_string(size) + ":" +
           std::to_string(mtime.time_since_epoch().count());
}

}  // namespace store_util
