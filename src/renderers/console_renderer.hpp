#ifndef REQ_PROBE_CONSOLE_RENDERER_HPP
#define REQ_PROBE_CONSOLE_RENDERER_HPP

#include <iostream>
#include <optional>
#include <ostream>
#include <string>

#include "interface.hpp"

namespace renderers {
    struct ConsoleLabels {
        static constexpr const char* URL = "Requesting URL: ";
        static constexpr const char* METHOD = "Method: ";
        static constexpr const char* JSON = "JSON: ";
        static constexpr const char* DATA = "Data: ";
        static constexpr const char* FAILURE = "Error: ";
        static constexpr const char* JSON_BODY = "Response body (JSON with sorted keys):";
        static constexpr const char* TEXT_BODY = "Response body:";
    };

    class ConsoleRenderer : public IRenderer {
       public:
        ConsoleRenderer();
        ConsoleRenderer(std::ostream& out, std::ostream& err);

        void render_response(const http::model::RequestSpec& spec, const http::model::Response& resp, probe::OutcomeReport& report) override;
        void render_failure(const std::string& url, const std::string& method, const probe::Failure& failure) override;
        void render_fatal(const http::model::RequestSpec& spec, const probe::Failure& failure) override;

       private:
        void echo_request(std::ostream& os, const std::string& url, const std::string& method);

        std::ostream& out_;
        std::ostream& err_;
    };

    // The payload echoed for a POST: the JSON string, or the raw form data ("" when none).
    std::optional<std::string> echoed_payload(const http::model::RequestSpec& spec);
}  // namespace renderers

#endif
