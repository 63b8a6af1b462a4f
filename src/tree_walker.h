#pragma once

/**
 * @file tree_walker.h
 * @brief Lazy, deterministic enumeration of a directory tree
 */

#include "entry.h"
#include "fs.h"
#include "errors.h"

#include <string>
#include <vector>

namespace dirpost {

/**
 * @brief Depth-first pre-order walk of a transfer root
 *
 * Every directory is produced before its descendants, and siblings come in
 * byte-wise name order. The root itself is not produced. Symbolic links and
 * special files are skipped. Only the child lists of the directories on the
 * current path are held in memory.
 *
 * Usage:
 *   TreeWalker walker("/data/src");
 *   Entry entry;
 *   while (walker.next(entry)) { ... }
 */
class TreeWalker {
public:
    /**
     * @param root Directory to walk
     * @throws WalkError if root does not exist or is not a directory
     */
    explicit TreeWalker(const std::string& root);

    /**
     * @brief Produce the next entry
     * @return false once the walk is complete
     * @throws WalkError if a directory cannot be listed
     */
    bool next(Entry& entry);

    /**
     * @brief Restart the walk from the root
     */
    void reset();

    const std::string& root() const { return root_; }

    /**
     * @brief Local path of an entry under this walker's root
     */
    std::string local_path(const Entry& entry) const;

    // Entries skipped since the last reset (symlinks, special files)
    size_t skipped_count() const { return skipped_; }

private:
    struct Level {
        RelativePath prefix;
        std::vector<DirectoryEntry> children;
        size_t index;

        Level() : index(0) {}
    };

    void push_level(const RelativePath& prefix);

    std::string root_;
    std::vector<Level> stack_;
    bool started_;
    size_t skipped_;
};

/**
 * @brief Check that a path is an existing directory, without walking it
 * @throws WalkError otherwise
 */
void validate_transfer_root(const std::string& root);

} // namespace dirpost
