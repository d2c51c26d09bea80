#include "memboot/mirror.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include <spdlog/spdlog.h>

namespace memboot {

namespace fs = std::filesystem;

namespace {

class Mirror {
public:
    Mirror(const MirrorOptions& options, MirrorStats& stats)
        : excludes_(options.excludes.begin(), options.excludes.end()), stats_(stats) {}

    bool sync_directory(const fs::path& src, const fs::path& dst) {
        if (!ensure_directory(dst)) return false;

        // A read-only mode copied by an earlier run must not block this one;
        // the source mode is put back once the entries are in place
        add_owner_write(dst);

        std::error_code ec;
        std::set<std::string> source_names;
        for (fs::directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
            source_names.insert(it->path().filename().string());
        }
        if (ec) return fail("cannot list " + src.string(), ec);

        // Prune destination-only entries first so type changes below start clean
        std::vector<fs::path> stale;
        for (fs::directory_iterator it(dst, ec), end; !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (is_excluded(name)) continue;
            if (source_names.count(name) == 0) stale.push_back(it->path());
        }
        if (ec) return fail("cannot list " + dst.string(), ec);

        for (const auto& path : stale) {
            if (!remove_entry(path)) return false;
        }

        for (const auto& name : source_names) {
            if (is_excluded(name)) continue;
            if (!sync_entry(src / name, dst / name)) return false;
        }

        auto perms = fs::status(src, ec).permissions();
        if (!ec) {
            fs::permissions(dst, perms, fs::perm_options::replace, ec);
        }
        if (ec) {
            spdlog::debug("cannot copy permissions to {}: {}", dst.string(), ec.message());
        }
        return true;
    }

    const std::string& error() const { return error_; }

private:
    std::set<std::string> excludes_;
    MirrorStats& stats_;
    std::string error_;

    bool is_excluded(const std::string& name) const {
        return excludes_.count(name) > 0;
    }

    bool fail(const std::string& what, const std::error_code& ec) {
        error_ = what + ": " + ec.message();
        return false;
    }

    // Directories only; symlinks are not followed
    static void add_owner_write(const fs::path& dir) {
        std::error_code ec;
        auto st = fs::symlink_status(dir, ec);
        if (ec || !fs::is_directory(st)) return;
        if ((st.permissions() & fs::perms::owner_write) == fs::perms::none) {
            fs::permissions(dir, fs::perms::owner_write | fs::perms::owner_exec,
                            fs::perm_options::add, ec);
        }
    }

    static void make_tree_writable(const fs::path& root) {
        add_owner_write(root);
        std::error_code ec;
        if (!fs::is_directory(fs::symlink_status(root, ec))) return;
        for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_directory(ec) && !it->is_symlink(ec)) {
                add_owner_write(it->path());
            }
        }
    }

    bool remove_entry(const fs::path& path) {
        std::error_code ec;
        make_tree_writable(path);
        fs::remove_all(path, ec);
        if (ec) return fail("cannot remove " + path.string(), ec);
        spdlog::debug("removed stale {}", path.string());
        ++stats_.removed;
        return true;
    }

    bool ensure_directory(const fs::path& dst) {
        std::error_code ec;
        auto st = fs::symlink_status(dst, ec);
        if (fs::is_directory(st)) return true;
        if (fs::exists(st) || fs::is_symlink(st)) {
            make_tree_writable(dst);
            fs::remove_all(dst, ec);
            if (ec) return fail("cannot replace " + dst.string(), ec);
        }
        fs::create_directories(dst, ec);
        if (ec) return fail("cannot create " + dst.string(), ec);
        return true;
    }

    bool sync_entry(const fs::path& src, const fs::path& dst) {
        std::error_code ec;
        auto st = fs::symlink_status(src, ec);
        if (ec) return fail("cannot stat " + src.string(), ec);

        if (fs::is_symlink(st)) return sync_symlink(src, dst);
        if (fs::is_directory(st)) return sync_directory(src, dst);
        if (fs::is_regular_file(st)) return sync_file(src, dst);

        spdlog::debug("skipping special file {}", src.string());
        return true;
    }

    bool sync_symlink(const fs::path& src, const fs::path& dst) {
        std::error_code ec;
        auto target = fs::read_symlink(src, ec);
        if (ec) return fail("cannot read link " + src.string(), ec);

        auto dst_status = fs::symlink_status(dst, ec);
        if (fs::is_symlink(dst_status)) {
            auto existing = fs::read_symlink(dst, ec);
            if (!ec && existing == target) {
                ++stats_.unchanged;
                return true;
            }
        }
        if (fs::exists(dst_status) || fs::is_symlink(dst_status)) {
            make_tree_writable(dst);
            fs::remove_all(dst, ec);
            if (ec) return fail("cannot replace " + dst.string(), ec);
        }

        fs::create_symlink(target, dst, ec);
        if (ec) return fail("cannot create link " + dst.string(), ec);
        ++stats_.copied;
        return true;
    }

    bool sync_file(const fs::path& src, const fs::path& dst) {
        std::error_code ec;
        auto src_size = fs::file_size(src, ec);
        if (ec) return fail("cannot stat " + src.string(), ec);
        auto src_time = fs::last_write_time(src, ec);
        if (ec) return fail("cannot stat " + src.string(), ec);

        auto dst_status = fs::symlink_status(dst, ec);
        if (fs::is_regular_file(dst_status)) {
            std::error_code size_ec;
            std::error_code time_ec;
            auto dst_size = fs::file_size(dst, size_ec);
            auto dst_time = fs::last_write_time(dst, time_ec);
            if (!size_ec && !time_ec && dst_size == src_size && dst_time == src_time) {
                ++stats_.unchanged;
                return true;
            }
        }
        if (fs::exists(dst_status) || fs::is_symlink(dst_status)) {
            make_tree_writable(dst);
            fs::remove_all(dst, ec);
            if (ec) return fail("cannot replace " + dst.string(), ec);
        }

        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) return fail("cannot copy " + src.string(), ec);

        fs::last_write_time(dst, src_time, ec);
        if (ec) return fail("cannot set mtime on " + dst.string(), ec);
        auto perms = fs::status(src, ec).permissions();
        if (ec) return fail("cannot stat " + src.string(), ec);
        fs::permissions(dst, perms, fs::perm_options::replace, ec);
        if (ec) return fail("cannot set permissions on " + dst.string(), ec);

        ++stats_.copied;
        return true;
    }
};

// True if `inner` equals `outer` or lies below it
bool is_within(const fs::path& inner, const fs::path& outer) {
    auto mismatch = std::mismatch(outer.begin(), outer.end(), inner.begin(), inner.end());
    return mismatch.first == outer.end();
}

} // namespace

MirrorResult mirror_tree(const std::string& source,
                         const std::string& destination,
                         const MirrorOptions& options) {
    MirrorResult result;

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        result.error = "source is not a directory: " + source;
        return result;
    }

    auto src = fs::weakly_canonical(source, ec);
    if (ec) {
        result.error = "cannot resolve " + source + ": " + ec.message();
        return result;
    }
    auto dst = fs::weakly_canonical(destination, ec);
    if (ec) {
        result.error = "cannot resolve " + destination + ": " + ec.message();
        return result;
    }

    if (src == dst) {
        result.ok = true;
        return result;
    }
    if (is_within(dst, src)) {
        result.error = "destination " + destination + " lies inside source " + source;
        return result;
    }

    Mirror mirror(options, result.stats);
    if (!mirror.sync_directory(src, dst)) {
        result.error = mirror.error();
        return result;
    }

    spdlog::debug("mirrored {} -> {} ({} copied, {} unchanged, {} removed)",
                  source, destination, result.stats.copied, result.stats.unchanged,
                  result.stats.removed);
    result.ok = true;
    return result;
}

} // namespace memboot
