#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace plumb {

/**
 * @brief The outcome of one finished process: its command line, exit status, and whatever was
 * captured from its stdout and stderr.
 *
 * The status is zero for success, a positive exit code, or the negated number of the signal that
 * killed the process.
 */
class result {
    std::vector<std::string>   _argv;
    int                        _status = 0;
    std::optional<std::string> _stdout;
    std::optional<std::string> _stderr;

public:
    result(std::vector<std::string>   argv,
           int                        status,
           std::optional<std::string> stdout_data = std::nullopt,
           std::optional<std::string> stderr_data = std::nullopt) noexcept
        : _argv(std::move(argv))
        , _status(status)
        , _stdout(std::move(stdout_data))
        , _stderr(std::move(stderr_data)) {}

    [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return _argv; }
    [[nodiscard]] int                             status() const noexcept { return _status; }
    /// The captured stdout, or nullopt if stdout was not captured
    [[nodiscard]] const std::optional<std::string>& stdout_() const noexcept { return _stdout; }
    /// The captured stderr, or nullopt if stderr was not captured
    [[nodiscard]] const std::optional<std::string>& stderr_() const noexcept { return _stderr; }

    [[nodiscard]] bool successful() const noexcept { return _status == 0; }

    /**
     * @brief Return this result if the status is zero.
     *
     * @throws result_error carrying the same fields if the status is non-zero
     */
    const result& check() const;

    /**
     * @brief Return this result if the status is zero. Otherwise, copy the captured stderr (if any)
     * to the stderr of the current program, and exit the program with the same status.
     */
    const result& die() const;

    friend bool operator==(const result&, const result&) = default;

    friend void do_repr(auto out, const result* self) noexcept {
        out.type("plumb::result");
        if (self) {
            out.append("{argv={}, status={}", out.repr_value(self->argv()), self->status());
            if (self->stdout_()) {
                out.append(", stdout={}", out.repr_value(*self->stdout_()));
            }
            if (self->stderr_()) {
                out.append(", stderr={}", out.repr_value(*self->stderr_()));
            }
            out.append("}");
        }
    }
};

/**
 * @brief Exception thrown by result::check() for a process that did not succeed.
 *
 * Carries the same fields as the result.
 */
class result_error : public std::runtime_error {
    result _result;

public:
    explicit result_error(result r);

    [[nodiscard]] const result& get_result() const noexcept { return _result; }

    [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return _result.argv(); }
    [[nodiscard]] int status() const noexcept { return _result.status(); }
    [[nodiscard]] const std::optional<std::string>& stdout_() const noexcept {
        return _result.stdout_();
    }
    [[nodiscard]] const std::optional<std::string>& stderr_() const noexcept {
        return _result.stderr_();
    }
};

}  // namespace plumb
