#include "sanitizer/sanitizer_config.h"
#include "utils/logger.h"
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace docsan {
namespace sanitizer {

namespace {

void readScrub(const nlohmann::json& j, document::ScrubOptions& scrub) {
    scrub.metadata = j.value("metadata", scrub.metadata);
    scrub.xml_metadata = j.value("xml_metadata", scrub.xml_metadata);
    scrub.javascript = j.value("javascript", scrub.javascript);
    scrub.attached_files = j.value("attached_files", scrub.attached_files);
    scrub.hidden_text = j.value("hidden_text", scrub.hidden_text);
    scrub.thumbnails = j.value("thumbnails", scrub.thumbnails);
}

} // namespace

nlohmann::json SanitizerConfig::yamlToJson(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return nullptr;
    }
    if (node.IsScalar()) {
        // Plain scalars: try the native types before falling back to string
        if (node.Tag() != "!") {
            bool b;
            if (YAML::convert<bool>::decode(node, b)) return b;
            long long i;
            if (YAML::convert<long long>::decode(node, i)) return i;
            double d;
            if (YAML::convert<double>::decode(node, d)) return d;
        }
        return node.Scalar();
    }
    if (node.IsSequence()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : node) {
            arr.push_back(yamlToJson(item));
        }
        return arr;
    }
    if (node.IsMap()) {
        nlohmann::json obj = nlohmann::json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj[it->first.Scalar()] = yamlToJson(it->second);
        }
        return obj;
    }
    return nullptr;
}

std::string SanitizerConfig::resolvePath(const std::string& path) {
    if (std::filesystem::exists(path) || std::filesystem::path(path).is_absolute()) {
        return path;
    }
    std::filesystem::path cur = std::filesystem::current_path();
    for (int i = 0; i < 4; ++i) {
        std::filesystem::path candidate = cur;
        for (int j = 0; j < i; ++j) candidate = candidate.parent_path();
        candidate /= path;
        if (std::filesystem::exists(candidate)) {
            return candidate.string();
        }
    }
    return path;
}

std::pair<Status, SanitizerConfig> SanitizerConfig::fromJson(const nlohmann::json& root) {
    SanitizerConfig cfg;
    if (root.is_null()) {
        return {Status::OK(), cfg};
    }
    if (!root.is_object()) {
        return {Status::Error(ErrorCode::ConfigError, "configuration root must be a mapping"),
                defaults()};
    }

    try {
        if (root.contains("splicer")) {
            const auto& s = root["splicer"];
            cfg.splicer.max_iterations = s.value("max_iterations", cfg.splicer.max_iterations);
            cfg.splicer.short_token_max_length =
                s.value("short_token_max_length", cfg.splicer.short_token_max_length);
            cfg.splicer.enable_fallback = s.value("enable_fallback", cfg.splicer.enable_fallback);
            cfg.unwrap_hyperlinks = s.value("unwrap_hyperlinks", cfg.unwrap_hyperlinks);
        }
        if (root.contains("safety_net")) {
            if (!root["safety_net"].is_object()) {
                return {Status::Error(ErrorCode::ConfigError, "safety_net must be a mapping"),
                        defaults()};
            }
            cfg.safety_net = root["safety_net"];
        }
        if (root.contains("page_redaction")) {
            const auto& p = root["page_redaction"];
            cfg.page_redaction.default_font = p.value("default_font", cfg.page_redaction.default_font);
            cfg.page_redaction.default_font_size =
                p.value("default_font_size", cfg.page_redaction.default_font_size);
            cfg.page_redaction.scrub_document =
                p.value("scrub_document", cfg.page_redaction.scrub_document);
            if (p.contains("scrub")) {
                readScrub(p["scrub"], cfg.page_redaction.scrub);
            }
        }
        cfg.page_redaction.short_token_max_length = cfg.splicer.short_token_max_length;
        if (root.contains("images")) {
            cfg.replace_images = root["images"].value("replace_with_placeholders", cfg.replace_images);
        }
        if (root.contains("logging")) {
            const auto& l = root["logging"];
            cfg.log_level = l.value("level", cfg.log_level);
            cfg.log_file = l.value("file", cfg.log_file);
        }
    } catch (const nlohmann::json::exception& e) {
        return {Status::Error(ErrorCode::ConfigError, std::string("invalid configuration: ") + e.what()),
                defaults()};
    }

    if (cfg.splicer.max_iterations == 0) {
        return {Status::Error(ErrorCode::ConfigError, "splicer.max_iterations must be positive"),
                defaults()};
    }
    return {Status::OK(), cfg};
}

std::pair<Status, SanitizerConfig> SanitizerConfig::fromYamlString(const std::string& yaml) {
    try {
        return fromJson(yamlToJson(YAML::Load(yaml)));
    } catch (const YAML::Exception& e) {
        return {Status::Error(ErrorCode::ConfigError, std::string("YAML parse error: ") + e.what()),
                defaults()};
    }
}

std::pair<Status, SanitizerConfig> SanitizerConfig::loadFromYaml(const std::string& path) {
    std::string resolved = resolvePath(path);
    std::pair<Status, SanitizerConfig> result;
    try {
        result = fromJson(yamlToJson(YAML::LoadFile(resolved)));
    } catch (const YAML::Exception& e) {
        result = {Status::Error(ErrorCode::ConfigError,
                                "cannot load " + resolved + ": " + e.what()),
                  defaults()};
    }

    if (result.first) {
        DOCSAN_INFO("SanitizerConfig: Loaded {}", resolved);
    } else {
        DOCSAN_WARN("SanitizerConfig: {}, using embedded defaults", result.first.message);
    }
    return result;
}

nlohmann::json SanitizerConfig::toJson() const {
    const auto& scrub = page_redaction.scrub;
    return {
        {"splicer", {{"max_iterations", splicer.max_iterations},
                     {"short_token_max_length", splicer.short_token_max_length},
                     {"enable_fallback", splicer.enable_fallback},
                     {"unwrap_hyperlinks", unwrap_hyperlinks}}},
        {"safety_net", safety_net},
        {"page_redaction", {{"default_font", page_redaction.default_font},
                            {"default_font_size", page_redaction.default_font_size},
                            {"scrub_document", page_redaction.scrub_document},
                            {"scrub", {{"metadata", scrub.metadata},
                                       {"xml_metadata", scrub.xml_metadata},
                                       {"javascript", scrub.javascript},
                                       {"attached_files", scrub.attached_files},
                                       {"hidden_text", scrub.hidden_text},
                                       {"thumbnails", scrub.thumbnails}}}}},
        {"images", {{"replace_with_placeholders", replace_images}}},
        {"logging", {{"level", log_level}, {"file", log_file}}}
    };
}

} // namespace sanitizer
} // namespace docsan
