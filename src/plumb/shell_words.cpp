#include "./shell_words.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

using namespace plumb;

namespace {

bool is_blank(char c) noexcept { return c == ' ' or c == '\t' or c == '\n' or c == '\r'; }

}  // namespace

std::vector<std::string> plumb::shell_split(std::string_view command) {
    std::vector<std::string>   words;
    std::optional<std::string> word;

    auto it   = command.begin();
    auto stop = command.end();
    while (it != stop) {
        char c = *it++;
        if (is_blank(c)) {
            if (word) {
                words.push_back(std::move(*word));
                word.reset();
            }
            continue;
        }
        if (not word) {
            word.emplace();
        }
        if (c == '\\') {
            if (it == stop) {
                throw std::invalid_argument("No escaped character after trailing backslash");
            }
            word->push_back(*it++);
        } else if (c == '\'') {
            auto close = std::find(it, stop, '\'');
            if (close == stop) {
                throw std::invalid_argument("No closing single quotation");
            }
            word->append(it, close);
            it = close + 1;
        } else if (c == '"') {
            while (true) {
                if (it == stop) {
                    throw std::invalid_argument("No closing double quotation");
                }
                c = *it++;
                if (c == '"') {
                    break;
                }
                if (c == '\\' and it != stop
                    and (*it == '\\' or *it == '"' or *it == '$' or *it == '`' or *it == '\n')) {
                    c = *it++;
                }
                word->push_back(c);
            }
        } else {
            word->push_back(c);
        }
    }
    if (word) {
        words.push_back(std::move(*word));
    }
    return words;
}

bool plumb::argv_arg_needs_quoting(std::string_view arg) noexcept {
    if (arg.empty()) {
        return true;
    }
    std::string_view okay_chars = "@%-+=:,./_";
    return not std::all_of(arg.begin(), arg.end(), [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) or okay_chars.find(c) != okay_chars.npos;
    });
}

std::string plumb::quote_argv_arg(std::string_view arg) {
    if (!argv_arg_needs_quoting(arg)) {
        return std::string(arg);
    }
    std::string r = "'";
    for (char c : arg) {
        if (c == '\'') {
            // Close the quote, emit an escaped quote, and re-open
            r.append("'\\''");
        } else {
            r.push_back(c);
        }
    }
    r.push_back('\'');
    return r;
}
