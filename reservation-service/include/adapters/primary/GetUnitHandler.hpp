#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ReservationJson.hpp"
#include "ports/input/IReservationService.hpp"
#include <memory>
#include <iostream>

namespace reservation::adapters::primary
{

    /**
     * @brief GET /api/v1/units/{id} - свободная ёмкость единицы инвентаря
     *
     * Значение только для отображения: к моменту reserve оно может устареть.
     */
    class GetUnitHandler : public IHttpHandler
    {
    public:
        explicit GetUnitHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
            : reservationService_(std::move(reservationService))
        {
            std::cout << "[GetUnitHandler] Created" << std::endl;
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
                std::string unitId = req.getPathParam(0).value_or("");
                if (unitId.empty())
                {
                    json::sendError(res, 400, "INVALID_INPUT", "Unit ID is required");
                    return;
                }

                auto unit = reservationService_->getUnit(unitId);
                if (!unit)
                {
                    json::sendError(res, 404, "NOT_FOUND", "Inventory unit not found");
                    return;
                }

                res.setResult(200, "application/json", json::toJson(*unit).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetUnitHandler] Error: " << e.what() << std::endl;
                json::sendError(res, 503, "STORAGE_FAULT", "Storage unavailable");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> reservationService_;
    };

} // namespace reservation::adapters::primary
