#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ReservationJson.hpp"
#include "ports/input/IReservationService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reservation::adapters::primary
{

    /**
     * @brief PATCH /api/v1/reservations/{id} - подтвердить резервацию
     *
     * Роутер регистрирует с паттерном "/api/v1/reservations/*".
     * Повторное подтверждение - 409 INVALID_STATE.
     */
    class ConfirmReservationHandler : public IHttpHandler
    {
    public:
        explicit ConfirmReservationHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
            : reservationService_(std::move(reservationService))
        {
            std::cout << "[ConfirmReservationHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "PATCH")
            {
                json::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
                return;
            }

            try
            {
                std::string reservationId = req.getPathParam(0).value_or("");
                if (reservationId.empty())
                {
                    json::sendError(res, 400, "INVALID_INPUT", "Reservation ID is required");
                    return;
                }

                auto result = reservationService_->confirm(reservationId);
                if (!result.ok())
                {
                    json::sendFailure(res, result);
                    return;
                }

                nlohmann::json response;
                response["reservation_id"] = reservationId;
                response["status"] = domain::toString(result.status);
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ConfirmReservationHandler] Error: " << e.what() << std::endl;
                json::sendError(res, 500, "INTERNAL_ERROR", "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> reservationService_;
    };

} // namespace reservation::adapters::primary
