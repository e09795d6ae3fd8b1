#pragma once

#include <optional>

#include "Session.hpp"

/**
 * @brief Source of tag reads for the SessionController.
 * @details
 * **Contract:** Poll() returns the identifier of the tag currently in the
 * field, or std::nullopt when there is none. Transient read failures are
 * reported as std::nullopt, never as exceptions.
 * **Timing:** Must return within its read timeout, which is shorter than
 * the controller's poll interval.
 */
struct ITagSensor {
    virtual ~ITagSensor() = default;

    virtual std::optional<TagId> Poll() = 0;
};
