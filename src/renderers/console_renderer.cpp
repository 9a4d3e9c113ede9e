#include "console_renderer.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <variant>

#include "../utils/json_utils.hpp"
#include "../utils/logging.hpp"

namespace renderers {
    ConsoleRenderer::ConsoleRenderer() : out_(std::cout), err_(std::cerr) {}

    ConsoleRenderer::ConsoleRenderer(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    std::optional<std::string> echoed_payload(const http::model::RequestSpec& spec) {
        if (!spec.is_post()) {
            return std::nullopt;
        }
        if (const auto* json = std::get_if<http::model::RawJsonBody>(&spec.body_)) {
            return json->json_;
        }
        if (const auto* form = std::get_if<http::model::FormBody>(&spec.body_)) {
            return form->raw_;
        }
        return std::string{};
    }

    void ConsoleRenderer::echo_request(std::ostream& os, const std::string& url, const std::string& method) {
        os << ConsoleLabels::URL << url << "\n" << ConsoleLabels::METHOD << method << "\n";
    }

    void ConsoleRenderer::render_response(const http::model::RequestSpec& spec, const http::model::Response& resp, probe::OutcomeReport& report) {
        echo_request(out_, spec.url_, spec.method_);

        report.echoed_payload_ = echoed_payload(spec);
        if (report.echoed_payload_) {
            out_ << (spec.has_json() ? ConsoleLabels::JSON : ConsoleLabels::DATA) << *report.echoed_payload_ << "\n";
        }

        // Response-side canonicalization; the request body was sent untouched.
        if (auto pretty = json_utils::to_sorted_pretty_json(resp.body_)) {
            report.body_kind_ = probe::BodyKind::JSON;
            report.rendered_body_ = std::move(*pretty);
            out_ << ConsoleLabels::JSON_BODY << "\n" << report.rendered_body_ << "\n";
        } else {
            report.body_kind_ = probe::BodyKind::TEXT;
            report.rendered_body_ = resp.body_;
            out_ << ConsoleLabels::TEXT_BODY << "\n" << report.rendered_body_ << "\n";
        }
        out_.flush();

        logging::get().debug("rendered {} body ({} bytes)", report.body_kind_ == probe::BodyKind::JSON ? "json" : "text", report.rendered_body_.size());
    }

    void ConsoleRenderer::render_failure(const std::string& url, const std::string& method, const probe::Failure& failure) {
        echo_request(err_, url, method);
        err_ << ConsoleLabels::FAILURE << failure.message_ << "\n";
        err_.flush();
    }

    void ConsoleRenderer::render_fatal(const http::model::RequestSpec& spec, const probe::Failure& failure) {
        echo_request(err_, spec.url_, spec.method_);
        if (const auto* json = std::get_if<http::model::RawJsonBody>(&spec.body_)) {
            err_ << ConsoleLabels::JSON << json->json_ << "\n";
        }
        err_ << ConsoleLabels::FAILURE << failure.message_ << "\n";
        err_.flush();
    }
}  // namespace renderers
