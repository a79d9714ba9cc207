#include "list_store.hpp"
#include "guard_errors.hpp"
#include "file_logger.hpp"
#include "ip_address.hpp"
#include "string_utils.hpp"
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace {

std::string errno_text(int error_code) {
    return std::strerror(error_code);
}

} // namespace

// Advisory flock on the store's lock file, released on every exit path.
// An empty path takes no lock.
class ListStore::FileLock {
public:
    FileLock(const std::string& path, bool exclusive) {
        if (path.empty()) {
            return;
        }
        fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            int open_errno = errno;
            if (!exclusive) {
                return; // read-only callers (e.g. "show" as a non-root user) proceed unlocked
            }
            throw PersistenceError("Cannot open list lock file " + path + ": " +
                                   errno_text(open_errno), open_errno);
        }

        while (flock(fd_, exclusive ? LOCK_EX : LOCK_SH) != 0) {
            if (errno == EINTR) {
                continue;
            }
            int lock_errno = errno;
            close(fd_);
            fd_ = -1;
            throw PersistenceError("Cannot lock " + path + ": " + errno_text(lock_errno), lock_errno);
        }
    }

    ~FileLock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
            close(fd_);
        }
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

namespace {

// Writes a replacement list next to the target; commit() renames it into place.
// An uncommitted temp file is removed on destruction.
class AtomicListWriter {
public:
    explicit AtomicListWriter(const std::string& target)
        : target_(target), temp_path_(target + ".tmp." + std::to_string(getpid())) {
        fd_ = open(temp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            int open_errno = errno;
            throw PersistenceError("Cannot create " + temp_path_ + ": " + errno_text(open_errno),
                                   open_errno);
        }
    }

    ~AtomicListWriter() {
        if (fd_ >= 0) {
            close(fd_);
        }
        if (!committed_) {
            unlink(temp_path_.c_str());
        }
    }

    AtomicListWriter(const AtomicListWriter&) = delete;
    AtomicListWriter& operator=(const AtomicListWriter&) = delete;

    void write_all(const std::string& content) {
        size_t offset = 0;
        while (offset < content.size()) {
            ssize_t written = ::write(fd_, content.data() + offset, content.size() - offset);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int write_errno = errno;
                throw PersistenceError("Write to " + temp_path_ + " failed: " +
                                       errno_text(write_errno), write_errno);
            }
            offset += static_cast<size_t>(written);
        }
    }

    void commit() {
        if (fsync(fd_) != 0) {
            int sync_errno = errno;
            throw PersistenceError("fsync of " + temp_path_ + " failed: " + errno_text(sync_errno),
                                   sync_errno);
        }
        if (close(fd_) != 0) {
            fd_ = -1;
            int close_errno = errno;
            throw PersistenceError("close of " + temp_path_ + " failed: " + errno_text(close_errno),
                                   close_errno);
        }
        fd_ = -1;

        if (rename(temp_path_.c_str(), target_.c_str()) != 0) {
            int rename_errno = errno;
            throw PersistenceError("Cannot replace " + target_ + ": " + errno_text(rename_errno),
                                   rename_errno);
        }
        committed_ = true;
    }

private:
    std::string target_;
    std::string temp_path_;
    int fd_ = -1;
    bool committed_ = false;
};

} // namespace

bool ListStore::FileSignature::operator==(const FileSignature& other) const {
    if (exists != other.exists) {
        return false;
    }
    if (!exists) {
        return true;
    }
    return device == other.device && inode == other.inode && size == other.size &&
           mtime.tv_sec == other.mtime.tv_sec && mtime.tv_nsec == other.mtime.tv_nsec;
}

ListStore::ExclusiveSection::ExclusiveSection(ListStore& store)
    : store_(store), lock_(store.mutex_) {
    if (store_.section_depth_ == 0) {
        store_.section_lock_ = std::make_unique<FileLock>(store_.lock_path_, true);
    }
    store_.section_depth_++;
}

ListStore::ExclusiveSection::~ExclusiveSection() {
    if (--store_.section_depth_ == 0) {
        store_.section_lock_.reset();
    }
}

ListStore::ListStore(std::string allow_list_path, std::string deny_list_path)
    : lock_path_(allow_list_path + ".lock") {
    list(ListKind::ALLOWED).path = std::move(allow_list_path);
    list(ListKind::DENIED).path = std::move(deny_list_path);
}

ListStore::~ListStore() = default;

void ListStore::load() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    FileLock file_lock(read_lock_path(), false);

    for (auto& file : lists_) {
        read_list_file(file);
    }
    resolve_overlap_locked();

    GUARD_LOG_INFO("Loaded " + std::to_string(list(ListKind::ALLOWED).entries.size()) +
                   " allowed and " + std::to_string(list(ListKind::DENIED).entries.size()) +
                   " denied addresses");
}

bool ListStore::contains(ListKind kind, const std::string& ip) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    FileLock file_lock(read_lock_path(), false);
    refresh_locked();
    return list(kind).entries.count(ip) > 0;
}

ListStore::AddResult ListStore::add(ListKind kind, const std::string& ip) {
    ip_address::require_ipv4(ip);

    ExclusiveSection section(*this);
    refresh_locked();

    ListFile& target = list(kind);
    ListFile& opposite = list(other(kind));

    AddResult result;
    if (target.entries.count(ip) > 0) {
        result.outcome = AddOutcome::ALREADY_PRESENT;
        return result;
    }

    auto target_backup = target.entries;
    auto opposite_backup = opposite.entries;

    result.removed_from_other = opposite.entries.erase(ip) > 0;
    target.entries.insert(ip);
    result.outcome = AddOutcome::ADDED;

    try {
        // Removal from the other list is committed first so the sets are never
        // both claiming the address on disk
        if (result.removed_from_other) {
            write_list_file(opposite);
        }
        write_list_file(target);
    } catch (const PersistenceError&) {
        target.entries = std::move(target_backup);
        if (result.removed_from_other) {
            opposite.entries = std::move(opposite_backup);
            try {
                write_list_file(opposite);
            } catch (const PersistenceError& restore_error) {
                GUARD_LOG_ERROR(std::string("Could not restore ") + opposite.path +
                                " after failed add: " + restore_error.what());
            }
        }
        throw;
    }

    return result;
}

ListStore::RemoveOutcome ListStore::remove(ListKind kind, const std::string& ip) {
    ip_address::require_ipv4(ip);

    ExclusiveSection section(*this);
    refresh_locked();

    ListFile& target = list(kind);
    if (target.entries.count(ip) == 0) {
        return RemoveOutcome::NOT_PRESENT;
    }

    target.entries.erase(ip);
    try {
        write_list_file(target);
    } catch (const PersistenceError&) {
        target.entries.insert(ip);
        throw;
    }
    return RemoveOutcome::REMOVED;
}

std::vector<std::string> ListStore::all(ListKind kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    FileLock file_lock(read_lock_path(), false);
    refresh_locked();

    const auto& entries = list(kind).entries;
    std::vector<std::string> addresses(entries.begin(), entries.end());
    std::sort(addresses.begin(), addresses.end(), ip_address::numeric_less);
    return addresses;
}

size_t ListStore::size(ListKind kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    FileLock file_lock(read_lock_path(), false);
    refresh_locked();
    return list(kind).entries.size();
}

const std::string& ListStore::path(ListKind kind) const {
    return list(kind).path;
}

const char* ListStore::list_kind_to_string(ListKind kind) {
    switch (kind) {
        case ListKind::ALLOWED: return "allow-list";
        case ListKind::DENIED: return "deny-list";
        default: return "unknown";
    }
}

ListStore::ListKind ListStore::other(ListKind kind) {
    return kind == ListKind::ALLOWED ? ListKind::DENIED : ListKind::ALLOWED;
}

void ListStore::refresh_locked() const {
    bool changed = false;
    for (auto& file : lists_) {
        if (!file.loaded || stat_signature(file.path) != file.signature) {
            read_list_file(file);
            changed = true;
        }
    }
    if (changed) {
        resolve_overlap_locked();
    }
}

void ListStore::read_list_file(ListFile& file) const {
    FileSignature signature = stat_signature(file.path);
    std::unordered_set<std::string> entries;

    if (signature.exists) {
        std::ifstream input(file.path);
        if (!input.is_open()) {
            int open_errno = errno;
            throw PersistenceError("Cannot read " + file.path + ": " + errno_text(open_errno),
                                   open_errno);
        }

        std::string line;
        size_t line_number = 0;
        while (std::getline(input, line)) {
            line_number++;
            std::string entry = string_utils::trim(line);
            if (entry.empty() || entry[0] == '#') {
                continue;
            }
            if (!ip_address::is_valid_ipv4(entry)) {
                GUARD_LOG_WARNING("Ignoring invalid address '" + entry + "' at " + file.path +
                                  ":" + std::to_string(line_number));
                continue;
            }
            entries.insert(entry);
        }

        if (input.bad()) {
            throw PersistenceError("I/O error while reading " + file.path);
        }
    }

    file.entries = std::move(entries);
    file.signature = signature;
    file.loaded = true;
}

void ListStore::resolve_overlap_locked() const {
    auto& allowed = list(ListKind::ALLOWED).entries;
    const auto& denied = list(ListKind::DENIED).entries;

    for (auto it = allowed.begin(); it != allowed.end();) {
        if (denied.count(*it) > 0) {
            GUARD_LOG_WARNING("Address " + *it + " is in both lists; treating it as denied");
            it = allowed.erase(it);
        } else {
            ++it;
        }
    }
}

void ListStore::write_list_file(ListFile& file) {
    std::vector<std::string> addresses(file.entries.begin(), file.entries.end());
    std::sort(addresses.begin(), addresses.end(), ip_address::numeric_less);

    std::string content;
    for (const auto& ip : addresses) {
        content += ip;
        content += '\n';
    }

    AtomicListWriter writer(file.path);
    writer.write_all(content);
    writer.commit();

    file.signature = stat_signature(file.path);
}

ListStore::FileSignature ListStore::stat_signature(const std::string& path) {
    FileSignature signature;
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return signature; // ENOENT/ENOTDIR read as an empty list; writes surface real errors
    }

    signature.exists = true;
    signature.device = st.st_dev;
    signature.inode = st.st_ino;
    signature.size = st.st_size;
    signature.mtime = st.st_mtim;
    return signature;
}
