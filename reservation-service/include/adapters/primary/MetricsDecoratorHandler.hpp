#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <iostream>

namespace reservation::adapters::primary
{

    /**
     * @brief Декоратор для подсчёта HTTP метрик
     *
     * Метрика: http_requests_total{method="...",path="..."}
     *
     * Path нормализуется (без ID), чтобы метрики группировались:
     * - /api/v1/reservations/6f1c... -> /api/v1/reservations
     * - /api/v1/units/FL-100 -> /api/v1/units
     */
    class MetricsDecoratorHandler : public IHttpHandler
    {
    public:
        MetricsDecoratorHandler(
            std::shared_ptr<IHttpHandler> inner,
            std::shared_ptr<ports::input::IMetricsService> metrics) : inner_(std::move(inner)), metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", normalizePath(req.getPath())}});
            inner_->handle(req, res);
        }

        static std::string normalizePath(const std::string &path)
        {
            std::string cleanPath = path.substr(0, path.find('?'));

            if (cleanPath.find("/api/v1/reservations/") == 0)
            {
                return "/api/v1/reservations";
            }
            if (cleanPath.find("/api/v1/units/") == 0)
            {
                return "/api/v1/units";
            }
            return cleanPath;
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
    };

} // namespace reservation::adapters::primary
