#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace skyhop {

// Keyed byte-range storage in one region. Every operation may throw
// ObjectStoreError; transient() tells the caller whether retrying can help.
// put() is idempotent by (key, offset): writing the same bytes twice leaves the
// object unchanged.
class ObjectStore {
  public:
    virtual ~ObjectStore() = default;

    virtual std::vector<char> get(const std::string &key, std::uint64_t offset, std::uint64_t length) = 0;

    virtual void put(const std::string &key, std::uint64_t offset, const std::vector<char> &data) = 0;

    virtual std::vector<std::string> list(const std::string &prefix) = 0;

    virtual void remove(const std::string &key) = 0;

    virtual std::uint64_t size(const std::string &key) = 0;
};

class MemoryObjectStore : public ObjectStore {
  public:
    std::vector<char> get(const std::string &key, std::uint64_t offset, std::uint64_t length) override;

    void put(const std::string &key, std::uint64_t offset, const std::vector<char> &data) override;

    std::vector<std::string> list(const std::string &prefix) override;

    void remove(const std::string &key) override;

    std::uint64_t size(const std::string &key) override;

    // Whole-object helpers for seeding and inspecting a store.
    void insert(const std::string &key, std::vector<char> data);

    std::vector<char> contents(const std::string &key) const;

    std::uint64_t write_count() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<char>> objects_;
    std::uint64_t writes_{0};
};

// Objects are files below a root directory; the key is the relative path.
class LocalObjectStore : public ObjectStore {
  public:
    explicit LocalObjectStore(std::filesystem::path root);

    std::vector<char> get(const std::string &key, std::uint64_t offset, std::uint64_t length) override;

    void put(const std::string &key, std::uint64_t offset, const std::vector<char> &data) override;

    std::vector<std::string> list(const std::string &prefix) override;

    void remove(const std::string &key) override;

    std::uint64_t size(const std::string &key) override;

    const std::filesystem::path &root() const noexcept { return root_; }

  private:
    std::filesystem::path resolve(const std::string &key) const;

    std::filesystem::path root_;
};

struct StoreConfig {
    // "memory" or "local"
    std::string provider;
    std::filesystem::path root;
};

std::shared_ptr<ObjectStore> make_object_store(const StoreConfig &config);

} // namespace skyhop
