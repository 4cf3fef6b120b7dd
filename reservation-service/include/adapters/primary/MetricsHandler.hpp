#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <iostream>

namespace reservation::adapters::primary {

/**
 * @brief GET /metrics - метрики в Prometheus text format 0.0.4
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {
        std::cout << "[MetricsHandler] Created" << std::endl;
    }
    
    void handle(IRequest& req, IResponse& res) override {
        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        res.setBody(metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace reservation::adapters::primary
