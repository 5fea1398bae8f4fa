#ifndef CROSSCHECK_CHECKPOINT_CHECKPOINT_STORE_H_
#define CROSSCHECK_CHECKPOINT_CHECKPOINT_STORE_H_

#include <cstdint>
#include <filesystem>
#include <string>

#include "../common/types.h"

namespace Crosscheck {

/**
 * Identity of a reconciliation: progress for one tuple never applies to another.
 */
struct CheckpointKey {
    ChainId chain = ChainId::BITCOIN;
    ProtocolId protocol = ProtocolId::ORDINAL;
    std::string primary_endpoint;
    std::string secondary_endpoint;

    bool operator==(const CheckpointKey& other) const {
        return chain == other.chain && protocol == other.protocol &&
               primary_endpoint == other.primary_endpoint &&
               secondary_endpoint == other.secondary_endpoint;
    }
    bool operator!=(const CheckpointKey& other) const { return !(*this == other); }

    // Stable across processes and platforms; used to name persisted records.
    std::string Fingerprint() const;
};

struct Checkpoint {
    CheckpointKey key;
    BlockHeight last_reconciled_height = 0;
    int64_t updated_at = 0;  // unix seconds
};

enum class CheckpointLoad {
    FOUND,
    NOT_FOUND,
    FOREIGN,   // a record exists under this key's slot but belongs to another tuple
    IO_ERROR
};

const char* CheckpointLoadName(CheckpointLoad result);

/**
 * Durable key/value record of reconciliation progress.
 * Save must replace the previous value atomically: after a crash a reader
 * sees either the old or the new checkpoint, never a mixture.
 */
class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    virtual CheckpointLoad Load(const CheckpointKey& key, Checkpoint& checkpoint, std::string& error) = 0;
    virtual bool Save(const Checkpoint& checkpoint, std::string& error) = 0;
};

/**
 * One YAML file per key under a directory, replaced via write-to-temp,
 * fsync, rename and directory fsync.
 */
class FileCheckpointStore : public ICheckpointStore {
public:
    explicit FileCheckpointStore(std::filesystem::path directory);

    CheckpointLoad Load(const CheckpointKey& key, Checkpoint& checkpoint, std::string& error) override;
    bool Save(const Checkpoint& checkpoint, std::string& error) override;

    std::filesystem::path PathFor(const CheckpointKey& key) const;

private:
    bool EnsureDirectory(std::string& error);

    std::filesystem::path directory_;
    bool directory_ready_ = false;
};

} // namespace Crosscheck

#endif // CROSSCHECK_CHECKPOINT_CHECKPOINT_STORE_H_
