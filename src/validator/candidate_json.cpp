#include "confine/candidate.hpp"

namespace confine {

namespace {

bool byte_array(const nlohmann::json& arr, Bytes& out) {
    out.clear();
    out.reserve(arr.size());
    for (const auto& elem : arr) {
        if (!elem.is_number_integer()) {
            return false;
        }
        auto v = elem.get<int64_t>();
        if (v < 0 || v > 255) {
            return false;
        }
        out.push_back(static_cast<uint8_t>(v));
    }
    return true;
}

} // namespace

Candidate candidate_from_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        return Bytes(bin.begin(), bin.end());
    }

    Bytes bytes;
    if (value.is_array()) {
        if (byte_array(value, bytes)) {
            return bytes;
        }
        return std::monostate{};
    }

    // Serialized buffer form: {"type": "Buffer", "data": [..]}
    if (value.is_object() && value.contains("type") && value["type"] == "Buffer" &&
        value.contains("data") && value["data"].is_array()) {
        if (byte_array(value["data"], bytes)) {
            return bytes;
        }
    }
    return std::monostate{};
}

} // namespace confine
