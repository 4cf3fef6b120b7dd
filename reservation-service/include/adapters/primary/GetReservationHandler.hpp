#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ReservationJson.hpp"
#include "ports/input/IReservationService.hpp"
#include <memory>
#include <iostream>

namespace reservation::adapters::primary
{

    /**
     * @brief GET /api/v1/reservations/{id} - резервация по ID
     */
    class GetReservationHandler : public IHttpHandler
    {
    public:
        explicit GetReservationHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
            : reservationService_(std::move(reservationService))
        {
            std::cout << "[GetReservationHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
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

                auto reservation = reservationService_->getReservation(reservationId);
                if (!reservation)
                {
                    json::sendError(res, 404, "NOT_FOUND", "Reservation not found");
                    return;
                }

                res.setResult(200, "application/json", json::toJson(*reservation).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetReservationHandler] Error: " << e.what() << std::endl;
                json::sendError(res, 503, "STORAGE_FAULT", "Storage unavailable");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> reservationService_;
    };

} // namespace reservation::adapters::primary
