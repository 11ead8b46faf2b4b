#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "services.hpp"

namespace assetlock {

// One file per key under a directory. Writes go to a temporary file that is
// then renamed over the old one, so a crash leaves either the old or the new
// record, never a torn one.
class FileStore : public DurableStore {
public:
    // Creates the directory if needed; throws PersistenceError when it
    // cannot
    explicit FileStore(std::filesystem::path directory);

    std::optional<std::string> read(const std::string& key) override;
    void write(const std::string& key, const std::string& data) override;
    void erase(const std::string& key) override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path directory_;
};

} // namespace assetlock
