#pragma once

#include "config.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

    // interpreter executable used when the caller does not name one
    std::string_view default_interpreter(source_language language);

    /*
     * argv prefix that loads `source` with the language's interpreter and calls `function`
     * with the arguments appended after it. Each argument is decoded as a literal where
     * possible (number, boolean) and passed as a string otherwise; the return value is
     * printed on stdout followed by a newline.
     *
     * An empty `interpreter` selects default_interpreter(language).
     */
    std::vector<std::string> interpreter_command(
            source_language language,
            const std::filesystem::path& source,
            std::string_view function,
            const std::filesystem::path& interpreter = {});

    // /bin/sh script that execs `command` with the script's own arguments appended
    std::string interpreter_shim(const std::vector<std::string>& command);

    std::string shell_quote(std::string_view arg);

}  // namespace pivot
