#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>

namespace crowd_ews::model {

enum class alert_level : std::uint8_t {
    GREEN = 0,
    YELLOW = 1,
    ORANGE = 2,
    RED = 3,
};

inline const char* to_string(const alert_level level) noexcept {
    switch (level) {
        case alert_level::GREEN:
            return "green";
        case alert_level::YELLOW:
            return "yellow";
        case alert_level::ORANGE:
            return "orange";
        case alert_level::RED:
            return "red";
    }
    return "green";
}

// All members in [0, 1].
struct index_set {
    float cai;
    float cdi;
    float thi;
    float ti;
    float ei;

    float ati;
    float sni;
    float pci;
};

static_assert(std::is_trivial_v<index_set>, "index_set must be trivial");

struct risk_snapshot {
    std::uint64_t sequence{0};
    std::int64_t timestamp_ms{0};
    std::string phase{};

    index_set indices{};
    float behavioral_intention{0.0F};
    float physical_risk{0.0F};
    float extended_risk{0.0F};

    alert_level level{alert_level::GREEN};

    bool degraded{false};
    std::uint32_t degraded_fields{0};
};

using snapshot_ptr = std::shared_ptr<const risk_snapshot>;

} // namespace crowd_ews::model
