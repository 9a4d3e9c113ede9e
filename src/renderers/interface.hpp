#ifndef REQ_PROBE_RENDERER_INTERFACE_HPP
#define REQ_PROBE_RENDERER_INTERFACE_HPP

#include <string>

#include "../http/model/model.hpp"
#include "../probe/outcome/outcome.hpp"

namespace renderers {
    class IRenderer {
       public:
        IRenderer() = default;
        virtual ~IRenderer() = default;
        IRenderer(const IRenderer&) = delete;
        IRenderer& operator=(const IRenderer&) = delete;
        IRenderer(IRenderer&&) = delete;
        IRenderer& operator=(IRenderer&&) = delete;

        // 2xx response: request echo plus the body, classified into `report`.
        virtual void render_response(const http::model::RequestSpec& spec, const http::model::Response& resp, probe::OutcomeReport& report) = 0;

        // Any reported failure, including a non-2xx status.
        virtual void render_failure(const std::string& url, const std::string& method, const probe::Failure& failure) = 0;

        // Invalid --json; the caller terminates right after.
        virtual void render_fatal(const http::model::RequestSpec& spec, const probe::Failure& failure) = 0;
    };
}  // namespace renderers

#endif
