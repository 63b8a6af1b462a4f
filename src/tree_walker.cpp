#include "tree_walker.h"
#include "logger.h"
#include <cerrno>
#include <sys/stat.h>

#define LOG_WALKER_DEBUG(message) LOG_DEBUG("walker", message)
#define LOG_WALKER_WARN(message)  LOG_WARN("walker", message)

namespace dirpost {

void validate_transfer_root(const std::string& root) {
    struct stat st;
    if (stat(root.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            throw WalkError("transfer root '" + root + "' does not exist");
        }
        throw WalkError(errno_message("cannot access transfer root '" + root + "'", errno));
    }
    if (!S_ISDIR(st.st_mode)) {
        throw WalkError("transfer root '" + root + "' is not a directory");
    }
}

TreeWalker::TreeWalker(const std::string& root)
    : root_(root), started_(false), skipped_(0) {
    validate_transfer_root(root_);
}

void TreeWalker::reset() {
    stack_.clear();
    started_ = false;
    skipped_ = 0;
}

std::string TreeWalker::local_path(const Entry& entry) const {
    return combine_paths(root_, entry.path_string());
}

void TreeWalker::push_level(const RelativePath& prefix) {
    std::string path = combine_paths(root_, join_relative_path(prefix));

    Level level;
    level.prefix = prefix;
    if (!list_directory(path, level.children)) {
        throw WalkError(errno_message("cannot list directory '" + path + "'", errno));
    }
    stack_.push_back(std::move(level));
}

bool TreeWalker::next(Entry& entry) {
    if (!started_) {
        started_ = true;
        push_level(RelativePath());
    }

    while (!stack_.empty()) {
        Level& top = stack_.back();
        if (top.index >= top.children.size()) {
            stack_.pop_back();
            continue;
        }

        const DirectoryEntry child = top.children[top.index++];
        RelativePath path = top.prefix;
        path.push_back(child.name);

        // Names the wire format cannot carry
        if (!is_valid_utf8(child.name) || child.name.find('\\') != std::string::npos ||
            join_relative_path(path).size() > MAX_PATH_LENGTH) {
            ++skipped_;
            LOG_WALKER_WARN("Skipping " << join_relative_path(path) << ": name cannot be transferred");
            continue;
        }

        switch (child.type) {
            case FileType::Directory:
                entry = Entry(EntryKind::Directory, path, 0);
                // top is invalidated past this point
                push_level(path);
                return true;

            case FileType::Regular:
                entry = Entry(EntryKind::File, std::move(path), child.size);
                return true;

            case FileType::Symlink:
            case FileType::Other:
                ++skipped_;
                LOG_WALKER_DEBUG("Skipping " << (child.type == FileType::Symlink ? "symlink" : "special file")
                                 << " " << join_relative_path(path));
                break;
        }
    }
    return false;
}

} // namespace dirpost
