#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>

namespace reservation::adapters::primary {

class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "reservation-service";
        response["version"] = "1.0.0";
        response["timestamp"] = domain::Timestamp::now().toString();

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace reservation::adapters::primary
