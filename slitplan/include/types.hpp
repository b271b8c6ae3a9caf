#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

// All linear quantities are millimeters.

enum class SlotStatus {
    SEQUENCED,
    FAILED
};

enum class ErrorKind {
    NONE,
    INVALID_INPUT,
    OPTIMIZATION_INFEASIBLE,
    DEADLINE_EXCEEDED
};

enum class PlanStatus {
    OK,
    PARTIAL_FAILURE
};

// JSON conversions for Enums
NLOHMANN_JSON_SERIALIZE_ENUM(SlotStatus, {
    {SlotStatus::SEQUENCED, "SEQUENCED"},
    {SlotStatus::FAILED, "FAILED"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorKind, {
    {ErrorKind::NONE, "NONE"},
    {ErrorKind::INVALID_INPUT, "INVALID_INPUT"},
    {ErrorKind::OPTIMIZATION_INFEASIBLE, "OPTIMIZATION_INFEASIBLE"},
    {ErrorKind::DEADLINE_EXCEEDED, "DEADLINE_EXCEEDED"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(PlanStatus, {
    {PlanStatus::OK, "OK"},
    {PlanStatus::PARTIAL_FAILURE, "PARTIAL_FAILURE"}
})

// Add nlohmann::json serializer for std::optional
namespace nlohmann {
    template <typename T>
    struct adl_serializer<std::optional<T>> {
        static void to_json(json& j, const std::optional<T>& opt) {
            if (opt == std::nullopt) {
                j = nullptr;
            } else {
                j = *opt;
            }
        }

        static void from_json(const json& j, std::optional<T>& opt) {
            if (j.is_null()) {
                opt = std::nullopt;
            } else {
                opt = j.get<T>();
            }
        }
    };
}

struct Coil {
    int64_t width;
    int64_t length;
};

struct Order {
    int64_t width;
    int64_t length;
};

// Coils and orders come either as {"width": w, "length": l} objects or as
// [w, l] rows exported from a spreadsheet.
inline void to_json(nlohmann::json& j, const Coil& coil) {
    j = nlohmann::json{{"width", coil.width}, {"length", coil.length}};
}

inline void from_json(const nlohmann::json& j, Coil& coil) {
    if (j.is_array()) {
        j.at(0).get_to(coil.width);
        j.at(1).get_to(coil.length);
    } else {
        j.at("width").get_to(coil.width);
        j.at("length").get_to(coil.length);
    }
}

inline void to_json(nlohmann::json& j, const Order& order) {
    j = nlohmann::json{{"width", order.width}, {"length", order.length}};
}

inline void from_json(const nlohmann::json& j, Order& order) {
    if (j.is_array()) {
        j.at(0).get_to(order.width);
        j.at(1).get_to(order.length);
    } else {
        j.at("width").get_to(order.width);
        j.at("length").get_to(order.length);
    }
}

struct Pattern {
    Coil coil;
    std::vector<int64_t> cuts;           // in ascending order-index order
    std::vector<size_t> order_indices;   // catalog positions of the selected orders
    int64_t total_length = 0;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Pattern, coil, cuts, order_indices, total_length)
};

struct AdjustedPattern {
    Coil coil;
    std::vector<int64_t> cuts;           // non-decreasing
    int64_t blade_travel = 0;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(AdjustedPattern, coil, cuts, blade_travel)
};

struct PlanEntry {
    SlotStatus status;
    ErrorKind error;
    std::string message;
    std::optional<Pattern> pattern;
    std::optional<AdjustedPattern> adjusted;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(PlanEntry, status, error, message, pattern, adjusted)
};

struct RecordIssue {
    std::string record;   // "coil" or "order"
    size_t index;
    std::string reason;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RecordIssue, record, index, reason)
};

struct Plan {
    std::vector<PlanEntry> entries;      // one per input coil, input order
    std::vector<RecordIssue> rejected_orders;

    // PARTIAL_FAILURE when at least one coil slot failed. Rejected orders do not
    // change the status; they are reported in rejected_orders.
    PlanStatus status() const {
        for (const auto& entry : entries) {
            if (entry.status == SlotStatus::FAILED) {
                return PlanStatus::PARTIAL_FAILURE;
            }
        }
        return PlanStatus::OK;
    }
};

inline void to_json(nlohmann::json& j, const Plan& plan) {
    j = nlohmann::json{
        {"status", plan.status()},
        {"entries", plan.entries},
        {"rejected_orders", plan.rejected_orders}
    };
}
