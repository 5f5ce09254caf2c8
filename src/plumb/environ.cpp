#include "./environ.hpp"

#include <cstdlib>

using namespace plumb;

std::optional<std::string> plumb::getenv(std::string_view key) noexcept {
    auto ptr = std::getenv(std::string(key).c_str());
    if (ptr) {
        return std::make_optional(std::string(ptr));
    } else {
        return std::nullopt;
    }
}

std::vector<std::string> plumb::environment_strings(const environment& env) {
    std::vector<std::string> ret;
    ret.reserve(env.size());
    for (auto& [key, value] : env) {
        ret.push_back(key + "=" + value);
    }
    return ret;
}
