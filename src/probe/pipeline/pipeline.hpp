#ifndef REQ_PROBE_PIPELINE_HPP
#define REQ_PROBE_PIPELINE_HPP

#pragma once

#include <functional>
#include <memory>

#include "../../cli/options/options.hpp"
#include "../../http/client/interface.hpp"
#include "../../renderers/interface.hpp"
#include "../outcome/outcome.hpp"

namespace probe {
    using HttpClientFactory = std::function<std::unique_ptr<http::client::IHttpClient>()>;
    using FatalHandler = std::function<void(const Failure&)>;

    // Validate -> resolve -> encode -> dispatch -> render, one request per run.
    class Pipeline {
       public:
        void set_http_client_factory(HttpClientFactory http_client_factory);
        void set_renderer(std::unique_ptr<renderers::IRenderer> renderer);
        void set_fatal_handler(FatalHandler fatal_handler);

        [[nodiscard]] const HttpClientFactory& get_http_client_factory() const;
        [[nodiscard]] const renderers::IRenderer* get_renderer() const;

        OutcomeReport run(const cli::options::CliOptions& options) const;

       private:
        OutcomeReport report_failure(OutcomeReport report, const Failure& failure) const;

        HttpClientFactory http_client_factory_;
        std::unique_ptr<renderers::IRenderer> renderer_;
        FatalHandler fatal_handler_;
    };

    class PipelineBuilder {
       public:
        PipelineBuilder();

        PipelineBuilder& with_http_client_factory(HttpClientFactory http_client_factory);
        PipelineBuilder& with_renderer(std::unique_ptr<renderers::IRenderer> renderer);
        PipelineBuilder& with_fatal_handler(FatalHandler fatal_handler);
        PipelineBuilder& validate();
        std::unique_ptr<Pipeline> build();

       private:
        std::unique_ptr<Pipeline> pipeline_;
        bool has_fatal_handler_ = false;
    };

    // Default fatal handler: logs and aborts the process.
    [[noreturn]] void abort_on_fatal(const Failure& failure);
}  // namespace probe

#endif
