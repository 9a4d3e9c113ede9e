#include "pipeline.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <variant>

#include "../../http/request/body_encoder.hpp"
#include "../../http/request/dispatcher.hpp"
#include "../../http/request/method_resolver.hpp"
#include "../../http/url/url_validator.hpp"
#include "../../utils/logging.hpp"

namespace probe {

    //
    // PipelineBuilder implementation
    //

    PipelineBuilder::PipelineBuilder() : pipeline_(std::make_unique<Pipeline>()) {}

    PipelineBuilder& PipelineBuilder::with_http_client_factory(HttpClientFactory http_client_factory) {
        pipeline_->set_http_client_factory(std::move(http_client_factory));
        return *this;
    }

    PipelineBuilder& PipelineBuilder::with_renderer(std::unique_ptr<renderers::IRenderer> renderer) {
        pipeline_->set_renderer(std::move(renderer));
        return *this;
    }

    PipelineBuilder& PipelineBuilder::with_fatal_handler(FatalHandler fatal_handler) {
        pipeline_->set_fatal_handler(std::move(fatal_handler));
        has_fatal_handler_ = true;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::validate() {
        if (pipeline_ == nullptr) {
            throw std::runtime_error("Pipeline already built");
        }
        if (pipeline_->get_http_client_factory() == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        if (pipeline_->get_renderer() == nullptr) {
            throw std::runtime_error("Renderer is required");
        }
        return *this;
    }

    std::unique_ptr<Pipeline> PipelineBuilder::build() {
        if (!has_fatal_handler_) {
            pipeline_->set_fatal_handler(abort_on_fatal);
        }
        return std::move(pipeline_);
    }

    void abort_on_fatal(const Failure& failure) {
        logging::get().critical("{}", failure.message_);
        logging::get().flush();
        std::abort();
    }

    //
    // Pipeline implementation
    //

    void Pipeline::set_http_client_factory(HttpClientFactory http_client_factory) { http_client_factory_ = std::move(http_client_factory); }

    void Pipeline::set_renderer(std::unique_ptr<renderers::IRenderer> renderer) { renderer_ = std::move(renderer); }

    void Pipeline::set_fatal_handler(FatalHandler fatal_handler) { fatal_handler_ = std::move(fatal_handler); }

    const HttpClientFactory& Pipeline::get_http_client_factory() const { return http_client_factory_; }

    const renderers::IRenderer* Pipeline::get_renderer() const { return renderer_.get(); }

    OutcomeReport Pipeline::report_failure(OutcomeReport report, const Failure& failure) const {
        logging::get().debug("stopped with {}: {}", to_string(failure.kind_), failure.message_);
        renderer_->render_failure(report.url_, report.method_, failure);
        report.status_ = failure.status_;
        report.error_ = failure;
        return report;
    }

    OutcomeReport Pipeline::run(const cli::options::CliOptions& options) const {
        OutcomeReport report;
        report.url_ = options.url_;
        // Needed up front: a rejected URL is still reported with the method it would have used.
        report.method_ = http::request::resolve_method(options.method_, options.json_.has_value());

        //
        // Validate
        //

        if (auto url_error = http::url::validate_url(options.url_)) {
            logging::get().debug("url rejected: {}", url_error->detail_);
            const bool missing_protocol = url_error->kind_ == http::url::UrlErrorKind::MISSING_PROTOCOL;
            return report_failure(std::move(report), Failure{
                                                         .kind_ = missing_protocol ? ErrorKind::INVALID_PROTOCOL : ErrorKind::URL_PARSE,
                                                         .message_ = http::url::describe(url_error->kind_),
                                                         .url_error_ = url_error->kind_,
                                                     });
        }

        //
        // Resolve + encode
        //

        const http::model::RequestSpec spec = http::request::build_request_spec(options.url_, options.method_, options.data_, options.json_);
        logging::get().debug("effective method: {}", spec.method_);

        auto encoded = http::request::encode_body(spec);
        if (failed(encoded)) {
            const auto& failure = std::get<Failure>(encoded);
            renderer_->render_fatal(spec, failure);
            report.error_ = failure;
            fatal_handler_(failure);
            return report;
        }

        //
        // Dispatch
        //

        auto client = http_client_factory_();
        auto dispatched = http::request::dispatch(*client, std::get<http::model::Request>(encoded));
        if (failed(dispatched)) {
            return report_failure(std::move(report), std::get<Failure>(dispatched));
        }

        //
        // Render
        //

        const auto& resp = std::get<http::model::Response>(dispatched);
        report.status_ = resp.status_;
        renderer_->render_response(spec, resp, report);
        return report;
    }
}  // namespace probe
