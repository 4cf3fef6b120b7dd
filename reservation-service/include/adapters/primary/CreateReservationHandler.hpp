#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ReservationJson.hpp"
#include "ports/input/IReservationService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <limits>
#include <iostream>

namespace reservation::adapters::primary
{

    /**
     * @brief POST /api/v1/reservations - зарезервировать ёмкость (шаг Reserve саги)
     *
     * Body: {"unit_id": "...", "booking_id": "...", "quantity": 2}
     * quantity необязателен, по умолчанию 1.
     */
    class CreateReservationHandler : public IHttpHandler
    {
    public:
        explicit CreateReservationHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
            : reservationService_(std::move(reservationService))
        {
            std::cout << "[CreateReservationHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                json::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                // Дробное, строковое или вне диапазона int64 количество - не число мест
                if (body.contains("quantity") &&
                    (!body["quantity"].is_number_integer() ||
                     (body["quantity"].is_number_unsigned() &&
                      body["quantity"].get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))))
                {
                    json::sendError(res, 400, "INVALID_INPUT", "quantity must be an integer");
                    return;
                }

                domain::ReservationRequest request;
                request.unitId = body.value("unit_id", "");
                request.bookingId = body.value("booking_id", "");
                request.quantity = body.value("quantity", static_cast<int64_t>(1));

                auto result = reservationService_->reserve(request);
                if (!result.ok())
                {
                    json::sendFailure(res, result);
                    return;
                }

                nlohmann::json response;
                response["reservation_id"] = result.reservationId;
                response["status"] = domain::toString(result.status);
                response["message"] = result.message;
                res.setResult(201, "application/json", response.dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                json::sendError(res, 400, "INVALID_INPUT", "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CreateReservationHandler] Error: " << e.what() << std::endl;
                json::sendError(res, 500, "INTERNAL_ERROR", "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> reservationService_;
    };

} // namespace reservation::adapters::primary
