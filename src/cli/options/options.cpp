#include "options.hpp"

#include <boost/program_options.hpp>

#include <sstream>
#include <string>

#include "../../utils/constants.hpp"

namespace po = boost::program_options;

namespace cli::options {
    struct OptionKeys {
        static constexpr const char* URL = "url";
        static constexpr const char* METHOD = "method";
        static constexpr const char* DATA = "data";
        static constexpr const char* JSON = "json";
        static constexpr const char* VERBOSE = "verbose";
        static constexpr const char* HELP = "help";
    };

    po::options_description visible_options() {
        po::options_description description("Options");
        // clang-format off
        description.add_options()
            ("method,X", po::value<std::string>()->default_value(constants::DEFAULT_METHOD), "HTTP method to use")
            ("data,d", po::value<std::string>(), "Form data to POST, as key=value&key2=value2")
            ("json", po::value<std::string>(), "Raw JSON body; forces the method to POST")
            ("verbose,v", "Log each stage to stderr")
            ("help,h", "Print this message and exit");
        // clang-format on
        return description;
    }

    CliOptions parse(int argc, const char* const argv[]) {
        po::options_description hidden("Positional");
        hidden.add_options()(OptionKeys::URL, po::value<std::string>()->required(), "Target URL");

        po::options_description all;
        all.add(visible_options()).add(hidden);

        po::positional_options_description positional;
        positional.add(OptionKeys::URL, 1);

        po::variables_map vm;
        try {
            po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);

            CliOptions out;
            if (vm.count(OptionKeys::HELP) != 0) {
                out.help_ = true;
                return out;
            }

            po::notify(vm);

            out.url_ = vm[OptionKeys::URL].as<std::string>();
            out.method_ = vm[OptionKeys::METHOD].as<std::string>();
            if (vm.count(OptionKeys::DATA) != 0) {
                out.data_ = vm[OptionKeys::DATA].as<std::string>();
            }
            if (vm.count(OptionKeys::JSON) != 0) {
                out.json_ = vm[OptionKeys::JSON].as<std::string>();
            }
            out.verbose_ = vm.count(OptionKeys::VERBOSE) != 0;
            return out;
        } catch (const po::error& e) {
            throw UsageError(e.what());
        }
    }

    std::string usage(const std::string& program_name) {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " <url> [options]\n\n" << visible_options();
        return oss.str();
    }
}  // namespace cli::options
