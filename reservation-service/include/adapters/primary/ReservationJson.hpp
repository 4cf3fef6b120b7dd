#pragma once

#include "domain/Reservation.hpp"
#include "domain/InventoryUnit.hpp"
#include "domain/ReservationResult.hpp"
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace reservation::adapters::primary::json
{

    /**
     * @brief HTTP статус для кода ошибки движка
     *
     * Ошибки вызывающей стороны - 4xx, сбой хранилища - 503 (можно повторить).
     */
    inline int httpStatusFor(domain::ReservationError error)
    {
        switch (error)
        {
        case domain::ReservationError::NONE:
            return 200;
        case domain::ReservationError::INVALID_INPUT:
            return 400;
        case domain::ReservationError::NOT_FOUND:
            return 404;
        case domain::ReservationError::INSUFFICIENT_CAPACITY:
        case domain::ReservationError::INVALID_STATE:
            return 409;
        case domain::ReservationError::STORAGE_FAULT:
        default:
            return 503;
        }
    }

    inline nlohmann::json toJson(const domain::Reservation &reservation)
    {
        nlohmann::json j;
        j["reservation_id"] = reservation.id;
        j["unit_id"] = reservation.unitId;
        j["booking_id"] = reservation.bookingId;
        j["quantity"] = reservation.quantity;
        j["status"] = domain::toString(reservation.status);
        if (reservation.expiresAt)
        {
            j["expires_at"] = reservation.expiresAt->toString();
        }
        else
        {
            j["expires_at"] = nullptr;
        }
        j["created_at"] = reservation.createdAt.toString();
        j["updated_at"] = reservation.updatedAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const domain::InventoryUnit &unit)
    {
        nlohmann::json j;
        j["unit_id"] = unit.id;
        j["available_capacity"] = unit.availableCapacity;
        j["updated_at"] = unit.updatedAt.toString();
        return j;
    }

    inline void sendError(IResponse &res, int status, const std::string &code, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = code;
        error["message"] = message;
        res.setResult(status, "application/json", error.dump());
    }

    inline void sendFailure(IResponse &res, const domain::ReservationResult &result)
    {
        sendError(res, httpStatusFor(result.error), domain::toString(result.error), result.message);
    }

} // namespace reservation::adapters::primary::json
