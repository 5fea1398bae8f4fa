#include "checkpoint_store.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "../common/scoped_fd.h"

namespace Crosscheck {

namespace {

std::string Lower(const char* name) {
    std::string lower(name);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

bool WriteAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

std::string Errno(const std::string& what, const std::filesystem::path& path) {
    return what + " " + path.string() + ": " + strerror(errno);
}

} // namespace

std::string CheckpointKey::Fingerprint() const {
    // FNV-1a 64
    uint64_t hash = 1469598103934665603ULL;
    auto mix = [&hash](const std::string& part) {
        for (unsigned char c : part) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        hash ^= 0xff;  // separator
        hash *= 1099511628211ULL;
    };
    mix(ChainName(chain));
    mix(ProtocolName(protocol));
    mix(primary_endpoint);
    mix(secondary_endpoint);

    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}

const char* CheckpointLoadName(CheckpointLoad result) {
    switch (result) {
        case CheckpointLoad::FOUND: return "FOUND";
        case CheckpointLoad::NOT_FOUND: return "NOT_FOUND";
        case CheckpointLoad::FOREIGN: return "FOREIGN";
        case CheckpointLoad::IO_ERROR: return "IO_ERROR";
    }
    return "UNKNOWN";
}

FileCheckpointStore::FileCheckpointStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileCheckpointStore::PathFor(const CheckpointKey& key) const {
    return directory_ / (Lower(ChainName(key.chain)) + "_" + Lower(ProtocolName(key.protocol)) +
                         "_" + key.Fingerprint() + ".yaml");
}

bool FileCheckpointStore::EnsureDirectory(std::string& error) {
    if (directory_ready_) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        error = "Failed to create checkpoint directory " + directory_.string() + ": " + ec.message();
        return false;
    }
    directory_ready_ = true;
    return true;
}

CheckpointLoad FileCheckpointStore::Load(const CheckpointKey& key, Checkpoint& checkpoint, std::string& error) {
    std::filesystem::path path = PathFor(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            error = "Failed to stat " + path.string() + ": " + ec.message();
            return CheckpointLoad::IO_ERROR;
        }
        return CheckpointLoad::NOT_FOUND;
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        YAML::Node node = root["checkpoint"];
        if (!node) {
            error = "No checkpoint node in " + path.string();
            return CheckpointLoad::IO_ERROR;
        }

        Checkpoint loaded;
        if (!ParseChain(node["chain"].as<std::string>(), loaded.key.chain) ||
            !ParseProtocol(node["protocol"].as<std::string>(), loaded.key.protocol)) {
            error = "Unknown chain or protocol in " + path.string();
            return CheckpointLoad::IO_ERROR;
        }
        loaded.key.primary_endpoint = node["primary_endpoint"].as<std::string>();
        loaded.key.secondary_endpoint = node["secondary_endpoint"].as<std::string>();
        loaded.last_reconciled_height = node["last_reconciled_height"].as<BlockHeight>();
        loaded.updated_at = node["updated_at"].as<int64_t>();

        if (loaded.key != key) {
            error = "Checkpoint " + path.string() + " belongs to " + ChainName(loaded.key.chain) + "/" +
                    ProtocolName(loaded.key.protocol) + " " + loaded.key.primary_endpoint + " vs " +
                    loaded.key.secondary_endpoint;
            return CheckpointLoad::FOREIGN;
        }
        checkpoint = loaded;
        return CheckpointLoad::FOUND;
    } catch (const YAML::Exception& e) {
        error = "Failed to parse checkpoint " + path.string() + ": " + e.what();
        return CheckpointLoad::IO_ERROR;
    }
}

bool FileCheckpointStore::Save(const Checkpoint& checkpoint, std::string& error) {
    if (!EnsureDirectory(error)) {
        return false;
    }

    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "checkpoint" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "chain" << YAML::Value << ChainName(checkpoint.key.chain);
    out << YAML::Key << "protocol" << YAML::Value << ProtocolName(checkpoint.key.protocol);
    out << YAML::Key << "primary_endpoint" << YAML::Value << checkpoint.key.primary_endpoint;
    out << YAML::Key << "secondary_endpoint" << YAML::Value << checkpoint.key.secondary_endpoint;
    out << YAML::Key << "last_reconciled_height" << YAML::Value << checkpoint.last_reconciled_height;
    out << YAML::Key << "updated_at" << YAML::Value << checkpoint.updated_at;
    out << YAML::EndMap << YAML::EndMap;
    if (!out.good()) {
        error = std::string("Failed to encode checkpoint: ") + out.GetLastError();
        return false;
    }
    std::string content = std::string(out.c_str()) + "\n";

    std::filesystem::path path = PathFor(checkpoint.key);
    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";

    ScopedFd fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        error = Errno("Failed to open", tmp_path);
        return false;
    }
    if (!WriteAll(fd.get(), content)) {
        error = Errno("Failed to write", tmp_path);
        return false;
    }
    if (::fsync(fd.get()) != 0) {
        error = Errno("Failed to fsync", tmp_path);
        return false;
    }
    if (!fd.Close()) {
        error = Errno("Failed to close", tmp_path);
        return false;
    }
    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        error = Errno("Failed to rename onto", path);
        return false;
    }

    // Persist the rename itself.
    ScopedFd dir_fd(::open(directory_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dir_fd.valid() || ::fsync(dir_fd.get()) != 0) {
        error = Errno("Failed to fsync directory", directory_);
        return false;
    }

    VLOG(3) << "Checkpoint " << path.string() << " -> " << checkpoint.last_reconciled_height;
    return true;
}

} // namespace Crosscheck
