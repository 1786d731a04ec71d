#pragma once

#include "sanitizer/fragment_splicer.h"
#include "sanitizer/page_redaction_engine.h"
#include "sanitizer/sanitize_result.h"
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace YAML { class Node; }

namespace docsan {
namespace sanitizer {

/**
 * @brief Settings of one DocumentSanitizer
 *
 * Example (config/sanitizer.yaml):
 * @code{.yaml}
 * splicer:
 *   max_iterations: 50
 *   short_token_max_length: 3
 *   enable_fallback: true
 *   unwrap_hyperlinks: true
 * safety_net:
 *   enabled: true
 *   min_phone_digits: 7
 * page_redaction:
 *   default_font: helv
 *   default_font_size: 11.0
 *   scrub: { metadata: true, javascript: true }
 * images:
 *   replace_with_placeholders: true
 * logging:
 *   level: info
 *   file: docsan.log
 * @endcode
 */
struct SanitizerConfig {
    SplicerOptions splicer;
    bool unwrap_hyperlinks = true;
    nlohmann::json safety_net = nlohmann::json::object();   // RegexSafetyNet::initialize() section
    PageRedactionOptions page_redaction;
    bool replace_images = true;
    std::string log_level = "info";
    std::string log_file = "docsan.log";

    static SanitizerConfig defaults() { return SanitizerConfig{}; }

    /**
     * @brief Build a config from an already parsed document
     *
     * Missing keys keep their defaults. On a type mismatch the returned
     * status carries ConfigError and the config is the embedded default.
     */
    static std::pair<Status, SanitizerConfig> fromJson(const nlohmann::json& root);
    static std::pair<Status, SanitizerConfig> fromYamlString(const std::string& yaml);

    /**
     * @brief Load a YAML file
     *
     * A relative path that does not exist is also tried in up to three
     * parent directories of the working directory. On failure the embedded
     * defaults are returned together with a ConfigError status.
     */
    static std::pair<Status, SanitizerConfig> loadFromYaml(
        const std::string& path = "config/sanitizer.yaml");

    static std::string resolvePath(const std::string& path);
    static nlohmann::json yamlToJson(const YAML::Node& node);

    nlohmann::json toJson() const;
};

} // namespace sanitizer
} // namespace docsan
