#include <iostream>
#include <memory>
#include <string>

#include "src/cli/options/options.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/probe/pipeline/pipeline.hpp"
#include "src/renderers/console_renderer.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/logging.hpp"

int main(int argc, char* argv[]) {
    try {
        //
        // Collect
        //

        const std::string program_name = argc > 0 ? argv[0] : "req_probe";
        cli::options::CliOptions options;

        try {
            options = cli::options::parse(argc, argv);
        } catch (const cli::options::UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n\n" << cli::options::usage(program_name);
            return constants::EXIT_USAGE;
        }

        if (options.help_) {
            std::cout << cli::options::usage(program_name);
            return 0;
        }

        logging::init(options.verbose_);

        http::client::CurlGlobal curl_global;

        auto pipeline = probe::PipelineBuilder()
                            .with_http_client_factory([]() { return std::make_unique<http::client::CurlEasy>(); })
                            .with_renderer(std::make_unique<renderers::ConsoleRenderer>())
                            .validate()
                            .build();

        // Every outcome other than an invalid --json payload has already been reported.
        pipeline->run(options);
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
};
