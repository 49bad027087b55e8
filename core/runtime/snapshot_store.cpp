#include "runtime/snapshot_store.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace vita {

namespace fs = std::filesystem;

namespace {

const std::string SNAPSHOT_PREFIX = "snapshot_";
const std::string SNAPSHOT_EXTENSION = ".json";

/// Tick number encoded in a snapshot file name, or nullopt for any other file.
std::optional<uint64_t> tickFromPath(const fs::path& path) {
    if (path.extension() != SNAPSHOT_EXTENSION) return std::nullopt;
    std::string stem = path.stem().string();
    if (stem.compare(0, SNAPSHOT_PREFIX.size(), SNAPSHOT_PREFIX) != 0) return std::nullopt;

    std::string digits = stem.substr(SNAPSHOT_PREFIX.size());
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(digits));
    } catch (const std::out_of_range&) {
        spdlog::warn("ignoring snapshot with out-of-range tick: {}", path.string());
        return std::nullopt;
    }
}

} // namespace

FileSnapshotStore::FileSnapshotStore(std::string directory) : directory_(std::move(directory)) {
    if (directory_.empty()) throw ConfigurationError("snapshot directory must not be empty");
}

std::string FileSnapshotStore::pathFor(uint64_t ticks) const {
    std::ostringstream name;
    name << SNAPSHOT_PREFIX << std::setw(6) << std::setfill('0') << ticks << SNAPSHOT_EXTENSION;
    return (fs::path(directory_) / name.str()).string();
}

void FileSnapshotStore::saveSnapshot(const SelfState& state) {
    fs::create_directories(directory_);

    // Write to a temporary name, then rename into place
    std::string path = pathFor(state.ticks);
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out) throw std::runtime_error("cannot write snapshot: " + tmp);
        out << selfStateToJson(state).dump();
        if (!out) throw std::runtime_error("failed writing snapshot: " + tmp);
    }
    fs::rename(tmp, path);
    spdlog::debug("snapshot written: {}", path);
}

std::optional<uint64_t> FileSnapshotStore::latestTick() const {
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) return std::nullopt;

    std::optional<uint64_t> latest;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        auto ticks = tickFromPath(entry.path());
        if (ticks && (!latest || *ticks > *latest)) latest = ticks;
    }
    return latest;
}

SelfState FileSnapshotStore::loadLatestSnapshot() const {
    auto ticks = latestTick();
    if (!ticks) throw InvalidArgumentError("no snapshot in " + directory_);

    std::string path = pathFor(*ticks);
    std::ifstream in(path);
    if (!in) throw InvalidArgumentError("cannot read snapshot: " + path);
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError("snapshot " + path + " is not valid JSON: " + e.what());
    }
    return selfStateFromJson(doc);
}

} // namespace vita
