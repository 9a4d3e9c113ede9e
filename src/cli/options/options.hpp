#ifndef REQ_PROBE_OPTIONS_HPP
#define REQ_PROBE_OPTIONS_HPP

#include <boost/program_options.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace cli::options {
    struct CliOptions {
        std::string url_;
        std::optional<std::string> method_;
        std::optional<std::string> data_;
        std::optional<std::string> json_;
        bool verbose_ = false;
        bool help_ = false;
    };

    struct UsageError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Options shown in --help; the positional url is registered separately.
    [[nodiscard]] boost::program_options::options_description visible_options();

    // Throws UsageError on unknown options, missing values or a missing url (unless --help).
    [[nodiscard]] CliOptions parse(int argc, const char* const argv[]);

    [[nodiscard]] std::string usage(const std::string& program_name);
}  // namespace cli::options

#endif
