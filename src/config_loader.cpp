#include "input_module/config_loader.hpp"

// Use the system package include path
#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace fw::iom {

namespace {

// --- Helper: typed lookup that rejects present-but-mistyped keys ---
template <typename T, typename View>
std::optional<T> readValue(const View& node, const std::string& key, const std::string& source) {
    if (!node) {
        return std::nullopt;
    }
    auto value = node.template value<T>();
    if (!value) {
        throw std::runtime_error(source + ": '" + key + "' has the wrong type");
    }
    return value;
}

std::int64_t requireRange(std::int64_t value,
                          std::int64_t min_value,
                          std::int64_t max_value,
                          const std::string& key,
                          const std::string& source) {
    if (value < min_value || value > max_value) {
        throw std::runtime_error(source + ": '" + key + "' must be between " +
                                 std::to_string(min_value) + " and " + std::to_string(max_value));
    }
    return value;
}

template <typename View>
void requireTable(const View& node, const std::string& key, const std::string& source) {
    if (node && !node.is_table()) {
        throw std::runtime_error(source + ": [" + key + "] must be a table");
    }
}

// --- Section: [session] ---
void readSession(const toml::table& tbl, RetryPolicy& policy, const std::string& source) {
    const auto session = tbl["session"];
    requireTable(session, "session", source);
    if (!session) {
        return;
    }

    if (auto v = readValue<std::int64_t>(session["max_retries"], "session.max_retries", source)) {
        policy.max_retries = static_cast<std::uint32_t>(
            requireRange(*v, 1, 1000, "session.max_retries", source));
    }

    if (const auto backoff = session["backoff_ms"]) {
        const auto* arr = backoff.as_array();
        if (arr == nullptr) {
            throw std::runtime_error(source + ": 'session.backoff_ms' must be an array");
        }
        policy.backoff.clear();
        for (const auto& element : *arr) {
            auto delay = element.value<std::int64_t>();
            if (!delay) {
                throw std::runtime_error(source + ": 'session.backoff_ms' entries must be integers");
            }
            policy.backoff.emplace_back(requireRange(*delay, 0, 60000, "session.backoff_ms", source));
        }
    }

    if (auto v = readValue<bool>(session["allow_reopen"], "session.allow_reopen", source)) {
        policy.allow_reopen = *v;
    }
    if (auto v = readValue<std::int64_t>(session["write_timeout_ms"], "session.write_timeout_ms", source)) {
        policy.write_timeout = std::chrono::milliseconds(
            requireRange(*v, 1, 60000, "session.write_timeout_ms", source));
    }
    if (auto v = readValue<std::int64_t>(session["read_timeout_ms"], "session.read_timeout_ms", source)) {
        policy.read_timeout = std::chrono::milliseconds(
            requireRange(*v, 1, 60000, "session.read_timeout_ms", source));
    }
}

// --- Section: [[signatures]] ---
DeviceSignature readSignature(const toml::table& entry, std::size_t index, const std::string& source) {
    const std::string prefix = "signatures[" + std::to_string(index) + "].";
    DeviceSignature signature;

    signature.name = readValue<std::string>(entry["name"], prefix + "name", source)
                         .value_or("Custom device");

    auto vid = readValue<std::int64_t>(entry["vendor_id"], prefix + "vendor_id", source);
    auto pid = readValue<std::int64_t>(entry["product_id"], prefix + "product_id", source);
    if (!vid || !pid) {
        throw std::runtime_error(source + ": " + prefix + "vendor_id and product_id are required");
    }
    signature.vendor_id = static_cast<std::uint16_t>(requireRange(*vid, 0, 0xFFFF, prefix + "vendor_id", source));
    signature.product_id = static_cast<std::uint16_t>(requireRange(*pid, 0, 0xFFFF, prefix + "product_id", source));

    const auto kind_name = readValue<std::string>(entry["kind"], prefix + "kind", source);
    if (!kind_name) {
        throw std::runtime_error(source + ": " + prefix + "kind is required");
    }
    const auto kind = parseDeviceKind(*kind_name);
    if (!kind) {
        throw std::runtime_error(source + ": unknown device kind '" + *kind_name + "'");
    }
    signature.kind = *kind;

    if (auto v = readValue<std::int64_t>(entry["usage_page"], prefix + "usage_page", source)) {
        signature.usage_page = static_cast<std::uint16_t>(requireRange(*v, 0, 0xFFFF, prefix + "usage_page", source));
    }
    if (auto v = readValue<std::int64_t>(entry["usage"], prefix + "usage", source)) {
        signature.usage = static_cast<std::uint16_t>(requireRange(*v, 0, 0xFFFF, prefix + "usage", source));
    }
    return signature;
}

void readSignatures(const toml::table& tbl, std::vector<DeviceSignature>& out, const std::string& source) {
    const auto signatures = tbl["signatures"];
    if (!signatures) {
        return;
    }
    const auto* arr = signatures.as_array();
    if (arr == nullptr) {
        throw std::runtime_error(source + ": 'signatures' must be an array of tables");
    }
    std::size_t index = 0;
    for (const auto& node : *arr) {
        const auto* entry = node.as_table();
        if (entry == nullptr) {
            throw std::runtime_error(source + ": 'signatures' must be an array of tables");
        }
        out.push_back(readSignature(*entry, index++, source));
    }
}

// --- Section: [stats] ---
void readStats(const toml::table& tbl, StatsConfig& stats, const std::string& source) {
    const auto section = tbl["stats"];
    requireTable(section, "stats", source);
    if (!section) {
        return;
    }

    if (auto v = readValue<std::int64_t>(section["brightness"], "stats.brightness", source)) {
        stats.brightness = static_cast<int>(requireRange(*v, 0, 255, "stats.brightness", source));
    }
    if (auto v = readValue<std::int64_t>(section["frame_interval_ms"], "stats.frame_interval_ms", source)) {
        stats.frame_interval = std::chrono::milliseconds(
            requireRange(*v, 1, 3600000, "stats.frame_interval_ms", source));
    }
    if (auto v = readValue<std::int64_t>(section["background"], "stats.background", source)) {
        stats.background = static_cast<int>(requireRange(*v, 0, 255, "stats.background", source));
    }
    if (auto v = readValue<std::int64_t>(section["bar_intensity"], "stats.bar_intensity", source)) {
        stats.bar_intensity = static_cast<int>(requireRange(*v, 0, 255, "stats.bar_intensity", source));
    }
    if (auto v = readValue<std::int64_t>(section["max_displays"], "stats.max_displays", source)) {
        stats.max_displays = static_cast<std::size_t>(requireRange(*v, 1, 16, "stats.max_displays", source));
    }
}

RuntimeConfig buildConfig(const toml::table& tbl, const std::string& source) {
    RuntimeConfig config;

    if (auto transport = readValue<std::string>(tbl["transport"], "transport", source)) {
        if (*transport != "hidapi" && *transport != "logging") {
            throw std::runtime_error(source + ": unsupported transport '" + *transport + "'");
        }
        config.transport = *transport;
    }

    readSession(tbl, config.retry, source);
    readSignatures(tbl, config.signatures, source);
    readStats(tbl, config.stats, source);
    return config;
}

}  // namespace

RuntimeConfig ConfigLoader::loadFromFile(const std::string& path) const {
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error in " + path + ": " + std::string(err.description()));
    }
    return buildConfig(tbl, path);
}

RuntimeConfig ConfigLoader::loadFromString(std::string_view text, const std::string& source) const {
    toml::table tbl;
    try {
        tbl = toml::parse(text, source);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error in " + source + ": " + std::string(err.description()));
    }
    return buildConfig(tbl, source);
}

}  // namespace fw::iom
