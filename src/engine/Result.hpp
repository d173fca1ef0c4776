#pragma once

namespace delve {

/// Outcome of a core operation.
/// Only UnknownEntity signals a caller bug; the rest are expected
/// contention or capability gaps that callers resolve by policy.
enum class CoreResult {
    Success,
    UnknownEntity,      ///< Stale or never-allocated entity handle
    CellOccupied,       ///< A blocking entity already holds the cell
    OutOfBounds,        ///< Coordinate outside the map
    AlreadyPlaced,      ///< Entity is already in the spatial index
    PositionMismatch,   ///< Entity is not at the claimed source cell
    NoPathFound,
    MissingCapability,  ///< Entity lacks a component the operation needs
    DuplicateAction,    ///< Entity already submitted an action this turn
    InvalidPhase        ///< Scheduler is not in the phase the call requires
};

inline const char* toString(CoreResult result) {
    switch (result) {
        case CoreResult::Success:           return "Success";
        case CoreResult::UnknownEntity:     return "UnknownEntity";
        case CoreResult::CellOccupied:      return "CellOccupied";
        case CoreResult::OutOfBounds:       return "OutOfBounds";
        case CoreResult::AlreadyPlaced:     return "AlreadyPlaced";
        case CoreResult::PositionMismatch:  return "PositionMismatch";
        case CoreResult::NoPathFound:       return "NoPathFound";
        case CoreResult::MissingCapability: return "MissingCapability";
        case CoreResult::DuplicateAction:   return "DuplicateAction";
        case CoreResult::InvalidPhase:      return "InvalidPhase";
    }
    return "Unknown";
}

} // namespace delve
