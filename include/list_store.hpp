#ifndef LIST_STORE_HPP
#define LIST_STORE_HPP

#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include <sys/types.h>

/**
 * @brief Durable allow/deny address lists
 *
 * Each list is a line-oriented file with one address per line. The two sets
 * are kept disjoint: adding to one removes from the other before the change
 * is committed. Every mutation is written synchronously (temp file, fsync,
 * rename) under an exclusive advisory lock on "<allow-list>.lock", so a
 * mutation reported as successful is on disk, and a CLI process and the
 * monitoring daemon never interleave their writes.
 *
 * Lists are re-read whenever the file on disk changed since the last look,
 * which lets a running daemon observe edits made by the CLI.
 *
 * exclusive_section() holds the same lock across a caller's wider critical
 * section (list change plus the matching rule change). Calls made on this
 * store from the owning thread while a section is open reuse it.
 *
 * A failed write throws PersistenceError and leaves the in-memory sets as
 * they were before the call.
 */
class ListStore {
public:
    enum class ListKind : std::uint8_t {
        ALLOWED = 0,
        DENIED = 1
    };

    enum class AddOutcome : std::uint8_t {
        ADDED,
        ALREADY_PRESENT
    };

    enum class RemoveOutcome : std::uint8_t {
        REMOVED,
        NOT_PRESENT
    };

    struct AddResult {
        AddOutcome outcome = AddOutcome::ALREADY_PRESENT;
        bool removed_from_other = false; // address left the opposite list
    };

    // Scoped exclusive ownership of both lists, across threads and processes
    class ExclusiveSection {
    public:
        explicit ExclusiveSection(ListStore& store);
        ~ExclusiveSection();

        ExclusiveSection(const ExclusiveSection&) = delete;
        ExclusiveSection& operator=(const ExclusiveSection&) = delete;

    private:
        ListStore& store_;
        std::unique_lock<std::recursive_mutex> lock_;
    };

    ListStore(std::string allow_list_path, std::string deny_list_path);
    ~ListStore();

    ListStore(const ListStore&) = delete;
    ListStore& operator=(const ListStore&) = delete;

    // Throws PersistenceError when the lock file can not be opened or locked
    ExclusiveSection exclusive_section() { return ExclusiveSection(*this); }

    // Reads both lists. Missing files are empty lists. Throws PersistenceError.
    void load();

    bool contains(ListKind kind, const std::string& ip) const;
    AddResult add(ListKind kind, const std::string& ip);
    RemoveOutcome remove(ListKind kind, const std::string& ip);

    // Sorted numerically
    std::vector<std::string> all(ListKind kind) const;
    size_t size(ListKind kind) const;

    const std::string& path(ListKind kind) const;

    static const char* list_kind_to_string(ListKind kind);
    static ListKind other(ListKind kind);

private:
    class FileLock;

    struct FileSignature {
        bool exists = false;
        dev_t device = 0;
        ino_t inode = 0;
        off_t size = 0;
        struct timespec mtime {};

        bool operator==(const FileSignature& other) const;
        bool operator!=(const FileSignature& other) const { return !(*this == other); }
    };

    struct ListFile {
        std::string path;
        std::unordered_set<std::string> entries;
        FileSignature signature;
        bool loaded = false;
    };

    mutable std::recursive_mutex mutex_;
    mutable ListFile lists_[2];
    std::string lock_path_;

    // Held while an ExclusiveSection is open; guarded by mutex_
    std::unique_ptr<FileLock> section_lock_;
    unsigned int section_depth_ = 0;

    ListFile& list(ListKind kind) const { return lists_[static_cast<int>(kind)]; }

    // Path to flock for a read, or empty when this thread's open section covers it
    std::string read_lock_path() const { return section_depth_ > 0 ? std::string() : lock_path_; }

    void refresh_locked() const;
    void read_list_file(ListFile& file) const;
    void resolve_overlap_locked() const;
    void write_list_file(ListFile& file);

    static FileSignature stat_signature(const std::string& path);
};

#endif // LIST_STORE_HPP
