#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dscope
{
struct ScanEntry
{
    std::string   name;  // child name relative to the root
    std::uint64_t bytes = 0;
};

struct ScanLimits
{
    // Files taken from each child's walk per round.
    size_t batch_entries = 1024;
    // Wall-clock budget for one Step(); <= 0 runs until the scan finishes.
    double time_budget_s = 0.008;
};

// Sums file sizes per direct child of a root directory, a little at a time.
//
// Start() lists the root; child directories are only remembered by path. Each
// Step() then cycles through the children, taking up to `batch_entries` files
// from every open walk, round after round, until the time budget is spent. At
// most kMaxOpenWalks walks hold directory handles at once; the next child is
// opened when one finishes. Nothing blocks for long and no threads are
// involved, so the scan runs inside the frame loop on every host.
//
// A walk that runs out of file handles is restarted from scratch on a later
// round. Entries that cannot be read (permissions, races with deletion) are
// skipped.
class DirScanner
{
public:
    static constexpr size_t kMaxOpenWalks = 8;

    enum class State : std::uint8_t
    {
        Idle = 0,
        Scanning,
        Done,
        Error,
    };

    // Returns false (State::Error) when the root cannot be opened.
    bool Start(const std::string& root);

    // Abandons any scan in progress and forgets its results.
    void Stop();

    // Advances a running scan. Returns true on the call that finishes it.
    bool Step(const ScanLimits& limits);

    State              GetState() const { return state_; }
    bool               IsScanning() const { return state_ == State::Scanning; }
    const std::string& ErrorMessage() const { return error_; }
    const std::string& Root() const { return root_; }

    // Largest children first (ties by name), at most `n`. Children without a
    // counted file (empty or unreadable directories) are left out.
    std::vector<ScanEntry> Top(size_t n) const;

    std::uint64_t FilesCounted() const { return files_counted_; }
    size_t        ChildCount() const { return children_.size(); }

private:
    struct Child
    {
        std::string           name;
        std::filesystem::path path;
        std::uint64_t         bytes = 0;
        std::uint64_t         files = 0;
        bool                  open = false;
        bool                  done = false;
        std::filesystem::recursive_directory_iterator it;
    };

    // Returns false when the process is out of file handles (retry later).
    // An unreadable directory is marked done instead.
    bool OpenWalk(Child& c);
    void CloseWalk(Child& c);
    // Drops what the walk counted so far; it is reopened on a later round.
    void RestartWalk(Child& c);

    // Takes up to `batch` files from one child's walk.
    void Advance(Child& c, size_t batch);

    State state_ = State::Idle;
    std::string root_;
    std::string error_;
    std::vector<Child> children_;
    std::uint64_t files_counted_ = 0;
    size_t open_walks_ = 0;
    bool logged_out_of_handles_ = false;
};

const char* ScanStateName(DirScanner::State s);
} // namespace dscope
