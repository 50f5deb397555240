#include "core/dir_scanner.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <system_error>

namespace dscope
{
namespace fs = std::filesystem;

const char* ScanStateName(DirScanner::State s)
{
    switch (s)
    {
        case DirScanner::State::Idle: return "idle";
        case DirScanner::State::Scanning: return "scanning";
        case DirScanner::State::Done: return "done";
        case DirScanner::State::Error: return "error";
        default: return "unknown";
    }
}

namespace
{
static bool IsOutOfHandles(const std::error_code& ec)
{
    return ec == std::errc::too_many_files_open || ec == std::errc::too_many_files_open_in_system;
}
} // namespace

bool DirScanner::Start(const std::string& root)
{
    Stop();
    root_ = root;

    std::error_code ec;
    fs::directory_iterator dir(root, ec);
    if (ec)
    {
        state_ = State::Error;
        error_ = "On open root dir: " + root;
        std::fprintf(stderr, "[scan] %s (%s)\n", error_.c_str(), ec.message().c_str());
        return false;
    }

    for (const fs::directory_iterator end; dir != end; dir.increment(ec))
    {
        if (ec)
            break;
        const fs::directory_entry& e = *dir;
        Child c;
        c.name = e.path().filename().string();
        c.path = e.path();

        // Directories are walked later; no handle is held until then.
        std::error_code sec;
        const bool is_dir = e.is_directory(sec) && !e.is_symlink(sec);
        if (!is_dir)
        {
            if (e.is_regular_file(sec))
            {
                const std::uintmax_t sz = e.file_size(sec);
                if (!sec)
                {
                    c.bytes = sz;
                    c.files = 1;
                    files_counted_++;
                }
            }
            c.done = true;
        }
        children_.push_back(std::move(c));
    }

    state_ = State::Scanning;
    return true;
}

void DirScanner::Stop()
{
    state_ = State::Idle;
    error_.clear();
    children_.clear();
    files_counted_ = 0;
    open_walks_ = 0;
    logged_out_of_handles_ = false;
}

bool DirScanner::OpenWalk(Child& c)
{
    std::error_code ec;
    c.it = fs::recursive_directory_iterator(c.path, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        c.it = fs::recursive_directory_iterator();
        if (IsOutOfHandles(ec))
        {
            if (!logged_out_of_handles_)
            {
                std::fprintf(stderr, "[scan] out of file handles at %s; retrying\n", c.path.string().c_str());
                logged_out_of_handles_ = true;
            }
            return false;
        }
        // Unreadable subdirectory: nothing to count.
        c.done = true;
        return true;
    }
    c.open = true;
    open_walks_++;
    return true;
}

void DirScanner::CloseWalk(Child& c)
{
    if (!c.open)
        return;
    c.it = fs::recursive_directory_iterator();
    c.open = false;
    open_walks_--;
}

void DirScanner::RestartWalk(Child& c)
{
    CloseWalk(c);
    files_counted_ -= c.files;
    c.bytes = 0;
    c.files = 0;
}

void DirScanner::Advance(Child& c, size_t batch)
{
    const fs::recursive_directory_iterator end;
    size_t taken = 0;
    while (taken < batch && c.it != end)
    {
        std::error_code ec;
        const fs::directory_entry& e = *c.it;
        if (e.is_regular_file(ec) && !e.is_symlink(ec))
        {
            const std::uintmax_t sz = e.file_size(ec);
            if (!ec)
            {
                c.bytes += sz;
                c.files++;
                files_counted_++;
            }
            taken++;
        }

        c.it.increment(ec);
        if (ec)
        {
            if (IsOutOfHandles(ec))
            {
                RestartWalk(c);
                return;
            }
            // Walk broke mid-way (directory vanished, I/O error); keep what we have.
            CloseWalk(c);
            c.done = true;
            return;
        }
    }
    if (c.it == end)
    {
        CloseWalk(c);
        c.done = true;
    }
}

bool DirScanner::Step(const ScanLimits& limits)
{
    if (state_ != State::Scanning)
        return false;

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    const size_t batch = std::max<size_t>(limits.batch_entries, 1);

    for (;;)
    {
        bool any_left = false;
        bool progressed = false;
        for (Child& c : children_)
        {
            if (c.done)
                continue;
            any_left = true;
            if (!c.open)
            {
                if (open_walks_ >= kMaxOpenWalks || !OpenWalk(c))
                    continue;
                progressed = true;
                if (c.done)
                    continue;
            }
            Advance(c, batch);
            progressed = true;
        }

        if (!any_left)
        {
            state_ = State::Done;
            return true;
        }

        // Every remaining walk is waiting for file handles; try again next step.
        if (!progressed)
            return false;

        if (limits.time_budget_s > 0.0)
        {
            const double elapsed = std::chrono::duration<double>(clock::now() - t0).count();
            if (elapsed >= limits.time_budget_s)
                return false;
        }
    }
}

std::vector<ScanEntry> DirScanner::Top(size_t n) const
{
    std::vector<ScanEntry> out;
    out.reserve(children_.size());
    for (const Child& c : children_)
        if (c.files > 0)
            out.push_back(ScanEntry{c.name, c.bytes});

    std::sort(out.begin(), out.end(), [](const ScanEntry& a, const ScanEntry& b) {
        if (a.bytes != b.bytes)
            return a.bytes > b.bytes;
        return a.name < b.name;
    });
    if (out.size() > n)
        out.resize(n);
    return out;
}
} // namespace dscope
