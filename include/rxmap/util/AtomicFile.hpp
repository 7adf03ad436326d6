#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace rxmap::util {
namespace fs = std::filesystem;

inline fs::path make_tmp_path(const fs::path& out_path) {
  fs::path tmp = out_path;
  tmp += ".tmp";
  return tmp;
}

// Rename a fully written temporary file over the target.
inline void atomic_rename_over(const fs::path& tmp_path, const fs::path& out_path) {
  std::error_code ec;
  fs::rename(tmp_path, out_path, ec);
  if (!ec) return;

  // Some filesystems refuse to rename over an existing path.
  if (fs::is_regular_file(out_path)) {
    fs::remove(out_path, ec);
    ec.clear();
    fs::rename(tmp_path, out_path, ec);
  }
  if (ec) {
    throw std::runtime_error("atomic rename failed: '" + tmp_path.string() + "' -> '" + out_path.string() + "' (" + ec.message() + ")");
  }
}

// Runs `fn` on a fresh stream at `tmp`. A throwing `fn` or a bad stream
// removes the temporary before the error propagates.
template <typename WriteFn>
inline void write_tmp_text(const fs::path& tmp, WriteFn&& fn) {
  std::ofstream ofs(tmp);
  if (!ofs) throw std::runtime_error("failed to open temp file for atomic write: " + tmp.string());
  std::error_code ec;
  try {
    fn(ofs);
  } catch (...) {
    ofs.close();
    fs::remove(tmp, ec);
    throw;
  }
  ofs.flush();
  if (!ofs) {
    ofs.close();
    fs::remove(tmp, ec);
    throw std::runtime_error("failed while writing temp file: " + tmp.string());
  }
}

// Text files that are replaced together. stage() writes `<out>.tmp`;
// commit() checks every target, then renames the temporaries in order.
// If a rename still fails, the targets already replaced by this commit are
// removed so no mixed set is left behind. Uncommitted temporaries are
// removed on destruction.
class AtomicFileSet {
public:
  AtomicFileSet() = default;
  AtomicFileSet(const AtomicFileSet&) = delete;
  AtomicFileSet& operator=(const AtomicFileSet&) = delete;
  ~AtomicFileSet() { discard(); }

  template <typename WriteFn>
  void stage(const fs::path& out_path, WriteFn&& fn) {
    for (const auto& s : staged_) {
      if (s.out == out_path) throw std::runtime_error("atomic write: '" + out_path.string() + "' staged twice");
    }
    const fs::path tmp = make_tmp_path(out_path);
    write_tmp_text(tmp, std::forward<WriteFn>(fn));
    staged_.push_back(Staged{out_path, tmp});
  }

  std::size_t size() const { return staged_.size(); }

  void commit() {
    for (const auto& s : staged_) {
      std::error_code ec;
      const auto st = fs::status(s.out, ec);
      if (fs::exists(st) && !fs::is_regular_file(st)) {
        throw std::runtime_error("atomic write: target '" + s.out.string() + "' exists and is not a regular file");
      }
    }
    std::size_t done = 0;
    try {
      for (; done < staged_.size(); ++done) atomic_rename_over(staged_[done].tmp, staged_[done].out);
    } catch (...) {
      std::error_code ec;
      for (std::size_t i = 0; i < done; ++i) fs::remove(staged_[i].out, ec);
      throw;
    }
    staged_.clear();
  }

  void discard() noexcept {
    std::error_code ec;
    for (const auto& s : staged_) fs::remove(s.tmp, ec);
    staged_.clear();
  }

private:
  struct Staged {
    fs::path out;
    fs::path tmp;
  };
  std::vector<Staged> staged_;
};

} // namespace rxmap::util
