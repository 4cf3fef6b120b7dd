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
     * @brief DELETE /api/v1/reservations/{id} - компенсирующая отмена
     *
     * Роутер регистрирует с паттерном "/api/v1/reservations/*".
     * Всегда 200, кроме сбоя хранилища: уже завершённая или неизвестная
     * резервация считается обработанной.
     */
    class CancelReservationHandler : public IHttpHandler
    {
    public:
        explicit CancelReservationHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
            : reservationService_(std::move(reservationService))
        {
            std::cout << "[CancelReservationHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "DELETE")
            {
                json::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
                return;
            }

            try
            {
                std::string reservationId = req.getPathParam(0).value_or("");

                auto result = reservationService_->cancel(reservationId);
                if (!result.ok())
                {
                    json::sendFailure(res, result);
                    return;
                }

                nlohmann::json response;
                response["reservation_id"] = reservationId;
                if (result.alreadyHandled)
                {
                    response["message"] = "Reservation already processed or not found";
                }
                else
                {
                    response["status"] = domain::toString(result.status);
                    response["message"] = "Reservation cancelled, capacity released";
                }
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CancelReservationHandler] Error: " << e.what() << std::endl;
                json::sendError(res, 500, "INTERNAL_ERROR", "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> reservationService_;
    };

} // namespace reservation::adapters::primary
