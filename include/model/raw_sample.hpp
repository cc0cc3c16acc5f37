#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace crowd_ews::model {

// Bit per raw field; set in a snapshot's degraded_fields when the value was
// substituted or clamped.
enum raw_field : std::uint32_t {
    FIELD_TEMPERATURE = 1U << 0U,
    FIELD_HUMIDITY = 1U << 1U,
    FIELD_DENSITY = 1U << 2U,
    FIELD_SPEED = 1U << 3U,
    FIELD_ATTITUDE = 1U << 4U,
    FIELD_SUBJECTIVE_NORM = 1U << 5U,
    FIELD_PERCEIVED_CONTROL = 1U << 6U,
};

// One collector reading. Empty optionals are fields that were absent or
// ill-typed on the wire.
struct raw_sample {
    std::int64_t timestamp_ms{0};
    std::string phase{};

    std::optional<float> temperature_c{};
    std::optional<float> humidity_pct{};
    std::optional<float> density_p_m2{};
    std::optional<float> speed_mps{};

    // Behavioral proxies, pre-scaled to [0, 1] by the collector.
    std::optional<float> attitude{};
    std::optional<float> subjective_norm{};
    std::optional<float> perceived_control{};

    // Optional richer signals.
    std::optional<float> speed_variance{};
    std::optional<float> push_rate{};
    std::optional<float> shout_rate{};
    std::optional<float> near_falls{};
    std::optional<float> event_intensity{};
};

} // namespace crowd_ews::model
