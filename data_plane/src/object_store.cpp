#include "skyhop/object_store.hpp"

#include "skyhop/errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace skyhop {

namespace {

bool is_transient_errno(int err) {
    switch (err) {
    case ENOENT:
    case EACCES:
    case EPERM:
    case EISDIR:
    case ENOTDIR:
    case EROFS:
        return false;
    default:
        return true;
    }
}

[[noreturn]] void throw_errno(const std::string &what, const std::filesystem::path &path) {
    int err = errno;
    std::ostringstream oss;
    oss << what << " '" << path.string() << "': " << std::strerror(err);
    throw ObjectStoreError(oss.str(), is_transient_errno(err));
}

class FileDescriptor {
  public:
    FileDescriptor(const std::filesystem::path &path, int flags) : fd_(::open(path.c_str(), flags, 0644)) {
        if (fd_ < 0) {
            throw_errno("failed to open", path);
        }
    }

    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    int get() const { return fd_; }

  private:
    int fd_;
};

} // namespace

std::vector<char> MemoryObjectStore::get(const std::string &key, std::uint64_t offset, std::uint64_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        throw ObjectStoreError("no such object: " + key, false);
    }
    const auto &data = it->second;
    if (offset > data.size() || length > data.size() - offset) {
        throw ObjectStoreError("range out of bounds for " + key, false);
    }
    auto first = data.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<char>(first, first + static_cast<std::ptrdiff_t>(length));
}

void MemoryObjectStore::put(const std::string &key, std::uint64_t offset, const std::vector<char> &data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &object = objects_[key];
    auto end = offset + data.size();
    if (object.size() < end) {
        object.resize(static_cast<std::size_t>(end));
    }
    std::copy(data.begin(), data.end(), object.begin() + static_cast<std::ptrdiff_t>(offset));
    ++writes_;
}

std::vector<std::string> MemoryObjectStore::list(const std::string &prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

void MemoryObjectStore::remove(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
}

std::uint64_t MemoryObjectStore::size(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        throw ObjectStoreError("no such object: " + key, false);
    }
    return it->second.size();
}

void MemoryObjectStore::insert(const std::string &key, std::vector<char> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = std::move(data);
}

std::vector<char> MemoryObjectStore::contents(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return {};
    }
    return it->second;
}

std::uint64_t MemoryObjectStore::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

LocalObjectStore::LocalObjectStore(std::filesystem::path root) : root_(std::move(root)) {
    if (root_.empty()) {
        throw std::invalid_argument("local object store needs a root directory");
    }
    std::filesystem::create_directories(root_);
}

std::filesystem::path LocalObjectStore::resolve(const std::string &key) const {
    if (key.empty()) {
        throw ObjectStoreError("object key must be non-empty", false);
    }
    auto relative = std::filesystem::path(key).lexically_normal();
    if (relative.is_absolute() || (!relative.empty() && *relative.begin() == "..")) {
        throw ObjectStoreError("object key escapes the store root: " + key, false);
    }
    return root_ / relative;
}

std::vector<char> LocalObjectStore::get(const std::string &key, std::uint64_t offset, std::uint64_t length) {
    auto path = resolve(key);
    FileDescriptor fd(path, O_RDONLY);
    std::vector<char> buffer(static_cast<std::size_t>(length));
    std::size_t done = 0;
    while (done < buffer.size()) {
        ssize_t rc = ::pread(fd.get(), buffer.data() + done, buffer.size() - done,
                             static_cast<off_t>(offset + done));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("read failed", path);
        }
        if (rc == 0) {
            throw ObjectStoreError("range out of bounds for " + key, false);
        }
        done += static_cast<std::size_t>(rc);
    }
    return buffer;
}

void LocalObjectStore::put(const std::string &key, std::uint64_t offset, const std::vector<char> &data) {
    auto path = resolve(key);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw ObjectStoreError("cannot create directory for " + key + ": " + ec.message(), true);
    }
    FileDescriptor fd(path, O_CREAT | O_WRONLY);
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t rc = ::pwrite(fd.get(), data.data() + written, data.size() - written,
                              static_cast<off_t>(offset + written));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("write failed", path);
        }
        written += static_cast<std::size_t>(rc);
    }
}

std::vector<std::string> LocalObjectStore::list(const std::string &prefix) {
    std::vector<std::string> keys;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        auto key = it->path().lexically_relative(root_).generic_string();
        if (key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(std::move(key));
        }
    }
    if (ec) {
        throw ObjectStoreError("cannot list " + root_.string() + ": " + ec.message(), true);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void LocalObjectStore::remove(const std::string &key) {
    auto path = resolve(key);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw ObjectStoreError("cannot remove " + key + ": " + ec.message(), true);
    }
}

std::uint64_t LocalObjectStore::size(const std::string &key) {
    auto path = resolve(key);
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throw_errno("cannot stat", path);
    }
    if (!S_ISREG(st.st_mode)) {
        throw ObjectStoreError("not a regular file: " + key, false);
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::shared_ptr<ObjectStore> make_object_store(const StoreConfig &config) {
    if (config.provider == "memory") {
        return std::make_shared<MemoryObjectStore>();
    }
    if (config.provider == "local") {
        return std::make_shared<LocalObjectStore>(config.root);
    }
    throw ConfigError("unknown object store provider: " + config.provider);
}

} // namespace skyhop
