#include "./syserror.hpp"

#include <cerrno>
#include <string>

using namespace plumb;

std::error_code plumb::get_current_error_code() noexcept {
    return std::error_code(errno, std::system_category());
}

void plumb::throw_for_system_error_code(int code, std::string_view message) {
    throw std::system_error(std::error_code(code, std::system_category()), std::string(message));
}

void plumb::throw_current_error(std::string_view message) {
    // Read errno before anything else can clobber it
    auto ec = get_current_error_code();
    throw std::system_error(ec, std::string(message));
}
