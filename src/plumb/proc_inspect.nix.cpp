#include "./proc_inspect.hpp"

#include "./file_handle.hpp"

#include <neo/ufmt.hpp>

#include <charconv>
#include <deque>
#include <filesystem>
#include <set>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

using namespace plumb;

namespace {

std::optional<::pid_t> parse_pid(std::string_view str) noexcept {
    ::pid_t ret   = 0;
    auto    first = str.data();
    auto    last  = first + str.size();
    auto [ptr, ec] = std::from_chars(first, last, ret);
    if (ec != std::errc{} or ptr != last or str.empty()) {
        return std::nullopt;
    }
    return ret;
}

std::vector<::pid_t> pid_entries(const fs::path& dir) {
    std::vector<::pid_t> ret;
    for (auto& entry : fs::directory_iterator{dir}) {
        if (auto pid = parse_pid(entry.path().filename().string())) {
            ret.push_back(*pid);
        }
    }
    return ret;
}

std::string read_proc_file(const fs::path& fpath) {
    return file_handle::open(fpath, open_mode::read).read();
}

std::string_view trim(std::string_view s) noexcept {
    auto first = s.find_first_not_of(" \t\n");
    if (first == s.npos) {
        return {};
    }
    auto last = s.find_last_not_of(" \t\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

std::vector<::pid_t> proc::pids() { return pid_entries("/proc"); }

std::map<std::string, std::string, std::less<>> proc::status(::pid_t pid) {
    std::map<std::string, std::string, std::less<>> ret;
    auto             content = read_proc_file(neo::ufmt("/proc/{}/status", pid));
    std::string_view tail    = content;
    while (not tail.empty()) {
        auto             nl   = tail.find('\n');
        std::string_view line = tail.substr(0, nl);
        tail                  = nl == tail.npos ? std::string_view{} : tail.substr(nl + 1);
        auto colon            = line.find(':');
        if (colon == line.npos) {
            continue;
        }
        ret.emplace(std::string(line.substr(0, colon)), std::string(trim(line.substr(colon + 1))));
    }
    return ret;
}

std::optional<std::string> proc::status(::pid_t pid, std::string_view key) {
    auto all = status(pid);
    auto it  = all.find(key);
    if (it == all.end()) {
        return std::nullopt;
    }
    return std::move(it->second);
}

bool proc::owned(::pid_t pid, std::optional<::uid_t> uid) {
    auto uids = status(pid, "Uid");
    if (not uids) {
        return false;
    }
    // Real, effective, saved, and filesystem UIDs. We want the first.
    std::string_view real = *uids;
    real                  = real.substr(0, real.find_first_of(" \t"));
    ::uid_t value         = 0;
    auto [ptr, ec]        = std::from_chars(real.data(), real.data() + real.size(), value);
    if (ec != std::errc{}) {
        return false;
    }
    return value == uid.value_or(::getuid());
}

std::vector<::pid_t> proc::tasks(::pid_t pid) {
    return pid_entries(neo::ufmt("/proc/{}/task", pid));
}

std::vector<::pid_t> proc::children(::pid_t pid, bool recursive) {
    std::vector<::pid_t> ret;
    std::set<::pid_t>    seen;
    std::deque<::pid_t>  queue{pid};
    while (not queue.empty()) {
        auto parent = queue.front();
        queue.pop_front();
        std::vector<std::string> listings;
        try {
            for (auto task : tasks(parent)) {
                listings.push_back(
                    read_proc_file(neo::ufmt("/proc/{}/task/{}/children", parent, task)));
            }
        } catch (const std::system_error& e) {
            // A descendant may exit while we walk the tree. Only the root must exist.
            bool vanished = e.code() == std::errc::no_such_file_or_directory
                or e.code() == std::errc::no_such_process;
            if (parent == pid or not vanished) {
                throw;
            }
            continue;
        }
        for (auto& content : listings) {
            std::string_view tail = content;
            while (not(tail = trim(tail)).empty()) {
                auto word = tail.substr(0, tail.find(' '));
                tail.remove_prefix(word.size());
                auto child = parse_pid(word);
                if (not child or not seen.insert(*child).second) {
                    continue;
                }
                ret.push_back(*child);
                if (recursive) {
                    queue.push_back(*child);
                }
            }
        }
    }
    return ret;
}
