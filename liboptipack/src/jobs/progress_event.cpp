#include "../../include/progress_event.hpp"
#include "../../include/errors.hpp"
#include <type_traits>

namespace optipack {

namespace {

    ImageFormat image_format_from_string(const std::string& name) {
        for (const ImageFormat fmt : {ImageFormat::Jpeg, ImageFormat::Png, ImageFormat::Gif,
                                      ImageFormat::Bmp, ImageFormat::Tiff, ImageFormat::Webp}) {
            if (image_format_to_string(fmt) == name) return fmt;
        }
        return ImageFormat::Unknown;
    }

    ResultStatus result_status_from_string(const std::string& name) {
        if (name == "success") return ResultStatus::Success;
        if (name == "skipped") return ResultStatus::Skipped;
        if (name == "error") return ResultStatus::Error;
        throw ValidationError("unknown result status: " + name);
    }

    OptimizedResult result_from_json(const nlohmann::json& j) {
        OptimizedResult r;
        r.name = j.at("name").get<std::string>();
        r.output_name = j.value("output_name", r.name);
        r.format = image_format_from_string(j.value("format", std::string("unknown")));
        r.original_size = j.at("original_size").get<std::uint64_t>();
        r.optimized_size = j.at("optimized_size").get<std::uint64_t>();
        r.saving_percentage = j.at("saving_percentage").get<double>();
        r.status = result_status_from_string(j.at("status").get<std::string>());
        if (j.contains("error_detail") && !j["error_detail"].is_null()) {
            r.error_detail = j["error_detail"].get<std::string>();
        }
        r.converted = j.value("converted", false);
        return r;
    }

} // namespace

std::string_view event_type(const ProgressEvent& event) noexcept {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Progress>) return "progress";
        else if constexpr (std::is_same_v<T, FileComplete>) return "file_complete";
        else if constexpr (std::is_same_v<T, Complete>) return "complete";
        else return "failed";
    }, event);
}

nlohmann::json to_json(const OptimizedResult& result) {
    nlohmann::json j = {
        {"name", result.name},
        {"output_name", result.output_name},
        {"format", image_format_to_string(result.format)},
        {"original_size", result.original_size},
        {"optimized_size", result.optimized_size},
        {"saving_percentage", result.saving_percentage},
        {"status", to_string(result.status)},
        {"converted", result.converted}
    };
    if (result.error_detail) {
        j["error_detail"] = *result.error_detail;
    }
    return j;
}

nlohmann::json to_json(const ProgressEvent& event) {
    nlohmann::json j = std::visit([](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Progress>) {
            return {{"percent", e.percent}};
        } else if constexpr (std::is_same_v<T, FileComplete>) {
            return to_json(e.result);
        } else if constexpr (std::is_same_v<T, Complete>) {
            return {{"artifact_id", e.artifact_id}};
        } else {
            return {{"reason", e.reason}};
        }
    }, event);
    j["type"] = event_type(event);
    return j;
}

std::string encode_event(const ProgressEvent& event) {
    return to_json(event).dump();
}

ProgressEvent decode_event(const std::string_view message) {
    try {
        const auto j = nlohmann::json::parse(message);
        const auto type = j.at("type").get<std::string>();
        if (type == "progress") {
            return Progress{j.at("percent").get<int>()};
        }
        if (type == "file_complete") {
            return FileComplete{result_from_json(j)};
        }
        if (type == "complete") {
            return Complete{j.at("artifact_id").get<std::string>()};
        }
        if (type == "failed") {
            return Failed{j.at("reason").get<std::string>()};
        }
        throw ValidationError("unknown event type: " + type);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed event: ") + e.what());
    }
}

} // namespace optipack
