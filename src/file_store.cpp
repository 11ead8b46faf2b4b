#include "file_store.hpp"
#include "error.hpp"
#include <fstream>
#include <sstream>

namespace assetlock {

namespace fs = std::filesystem;

namespace {
AssetLockError persistence_error(const std::string& message) {
    return AssetLockError(AssetLockError::ErrorType::PersistenceError, message);
}
} // namespace

FileStore::FileStore(fs::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw persistence_error("Failed to create state directory " + directory_.string() + ": " + ec.message());
    }
}

std::optional<std::string> FileStore::read(const std::string& key) {
    fs::path path = path_for(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw persistence_error("Failed to stat " + path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw persistence_error("Failed to open " + path.string() + " for reading");
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw persistence_error("Failed to read " + path.string());
    }
    return contents.str();
}

void FileStore::write(const std::string& key, const std::string& data) {
    fs::path path = path_for(key);
    fs::path temp = path;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw persistence_error("Failed to open " + temp.string() + " for writing");
        }
        file << data;
        file.flush();
        if (!file) {
            throw persistence_error("Failed to write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp, ec);
        throw persistence_error("Failed to replace " + path.string() + ": " + reason);
    }
}

void FileStore::erase(const std::string& key) {
    fs::path path = path_for(key);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw persistence_error("Failed to remove " + path.string() + ": " + ec.message());
    }
}

// Keys are fixed identifiers chosen by this program ("wallet",
// "continuation.registration"); anything that could escape the directory is
// refused
fs::path FileStore::path_for(const std::string& key) const {
    if (key.empty() || key.find('/') != std::string::npos || key.find('\\') != std::string::npos ||
        key == "." || key == "..") {
        throw persistence_error("Invalid store key: " + key);
    }
    return directory_ / (key + ".json");
}

} // namespace assetlock
