#include "./result.hpp"

#include "./file_handle.hpp"
#include "./shell_words.hpp"

#include <neo/ufmt.hpp>

#include <cstdlib>

#include <unistd.h>

using namespace plumb;

namespace {

std::string describe_failure(const result& r) {
    if (r.status() < 0) {
        return neo::ufmt("Command [{}] was terminated by signal {}",
                         quote_argv_string(r.argv()),
                         -r.status());
    }
    return neo::ufmt("Command [{}] returned non-zero exit status {}",
                     quote_argv_string(r.argv()),
                     r.status());
}

}  // namespace

result_error::result_error(result r)
    : runtime_error(describe_failure(r))
    , _result(std::move(r)) {}

const result& result::check() const {
    if (_status != 0) {
        throw result_error(*this);
    }
    return *this;
}

const result& result::die() const {
    if (_status == 0) {
        return check();
    }
    if (_stderr) {
        try {
            file_handle_stream err{file_handle_ref{STDERR_FILENO, open_mode::write}};
            err.write_all(const_buffer(std::string_view(*_stderr)));
        } catch (const std::system_error&) {
            // Forwarding is best-effort. We are exiting with the child's status regardless.
        }
    }
    std::exit(_status);
}
