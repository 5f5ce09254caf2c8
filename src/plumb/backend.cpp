#include "./backend.hpp"

#include <neo/ufmt.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <stdexcept>

using namespace plumb;

const backend plumb::posix_spawn_backend = {"posix_spawn", &spawn_posix, &posix_wait};
const backend plumb::fork_exec_backend   = {"fork_exec", &spawn_fork_exec, &posix_wait};
const backend plumb::subprocess_backend  = {"subprocess", &spawn_subprocess, &subprocess_wait};

namespace {

std::atomic<const backend*> S_default_backend{nullptr};

const backend& backend_from_environment() {
    auto name = plumb::getenv(backend_env_var);
    if (not name or name->empty()) {
        return posix_spawn_backend;
    }
    return find_backend(*name);
}

}  // namespace

std::span<const backend* const> plumb::backends() noexcept {
    static const std::array<const backend*, 3> all = {
        &posix_spawn_backend,
        &fork_exec_backend,
        &subprocess_backend,
    };
    return all;
}

const backend& plumb::find_backend(std::string_view name) {
    auto all   = backends();
    auto found = std::find_if(all.begin(), all.end(), [&](auto b) { return b->name == name; });
    if (found == all.end()) {
        throw std::invalid_argument(neo::ufmt("There is no process backend named '{}'", name));
    }
    return **found;
}

const backend& plumb::default_backend() {
    if (auto b = S_default_backend.load()) {
        return *b;
    }
    static const backend& from_env = backend_from_environment();
    return from_env;
}

void plumb::set_default_backend(const backend& b) noexcept { S_default_backend.store(&b); }

detail::exec_strings::exec_strings(std::vector<std::string> strings)
    : _strings(std::move(strings)) {
    _ptrs.reserve(_strings.size() + 1);
    for (auto& s : _strings) {
        _ptrs.push_back(s.data());
    }
    _ptrs.push_back(nullptr);
}

detail::stream_plan::stream_plan(const stream_map& streams) {
    for (auto& [child_fd, source] : streams) {
        if (source.get() != child_fd) {
            dups.emplace_back(source.get(), child_fd);
        }
    }
    for (auto& [child_fd, source] : streams) {
        auto fd = source.get();
        if (fd == child_fd or streams.contains(fd)) {
            continue;
        }
        if (std::find(closes.begin(), closes.end(), fd) == closes.end()) {
            closes.push_back(fd);
        }
    }
}
