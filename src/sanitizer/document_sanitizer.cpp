#include "sanitizer/document_sanitizer.h"
#include "document/image_placeholders.h"
#include "document/text_extractor.h"
#include "sanitizer/fragment_splicer.h"
#include "sanitizer/hyperlink_unwrapper.h"
#include "sanitizer/page_redaction_engine.h"
#include "utils/logger.h"
#include <stdexcept>

namespace docsan {
namespace sanitizer {

namespace {

void accumulate(const SpliceResult& result, SanitizeStats& stats) {
    stats.total_replacements += result.replacements;
    stats.degraded_rewrites += result.degraded_rewrites;
    stats.abandoned_entries += result.abandoned_entries;
}

} // namespace

DocumentSanitizer::DocumentSanitizer(SanitizerConfig config)
    : config_(std::move(config)) {
    if (!safety_net_.initialize(config_.safety_net)) {
        DOCSAN_WARN("DocumentSanitizer: Safety net config rejected ({}), using defaults",
                    safety_net_.getLastError());
        if (!safety_net_.initialize(nlohmann::json::object())) {
            DOCSAN_ERROR("DocumentSanitizer: Safety net defaults failed: {}",
                         safety_net_.getLastError());
        }
    }
}

void DocumentSanitizer::initLogging(const SanitizerConfig& config) {
    utils::Logger::init(config.log_file, utils::Logger::levelFromString(config.log_level));
}

ReplacementSetBuilder DocumentSanitizer::builderFromResponse(const std::string& raw) const {
    ReplacementSetBuilder builder;
    auto [status, accepted] = builder.addDetectorResponse(raw);
    if (!status) {
        DOCSAN_WARN("DocumentSanitizer: Unusable detector reply ({}), continuing with safety net only",
                    status.message);
    }
    DOCSAN_DEBUG("DocumentSanitizer: {} detector entries accepted", accepted);
    return builder;
}

std::pair<Status, SanitizeStats> DocumentSanitizer::sanitize(document::FlowDocument& doc,
                                                             const nlohmann::json& candidates) const {
    if (!candidates.is_null() && !candidates.is_array()) {
        return {Status::Error(ErrorCode::InvalidReplacementData, "candidates must be a JSON array"),
                SanitizeStats{}};
    }
    ReplacementSetBuilder builder;
    builder.addCandidates(candidates);
    return sanitizeWith(doc, std::move(builder));
}

std::pair<Status, SanitizeStats> DocumentSanitizer::sanitize(document::IFixedLayoutDocument& doc,
                                                             const nlohmann::json& candidates) const {
    if (!candidates.is_null() && !candidates.is_array()) {
        return {Status::Error(ErrorCode::InvalidReplacementData, "candidates must be a JSON array"),
                SanitizeStats{}};
    }
    ReplacementSetBuilder builder;
    builder.addCandidates(candidates);
    return sanitizeWith(doc, std::move(builder));
}

std::pair<Status, SanitizeStats> DocumentSanitizer::sanitizeDetectorResponse(
    document::FlowDocument& doc, const std::string& raw) const {
    return sanitizeWith(doc, builderFromResponse(raw));
}

std::pair<Status, SanitizeStats> DocumentSanitizer::sanitizeDetectorResponse(
    document::IFixedLayoutDocument& doc, const std::string& raw) const {
    return sanitizeWith(doc, builderFromResponse(raw));
}

void DocumentSanitizer::spliceFlow(document::FlowDocument& doc, const ReplacementSet& set,
                                   SanitizeStats& stats) const {
    FragmentSplicer splicer(set, config_.splicer);

    auto process = [&](document::Paragraph& p) {
        if (config_.unwrap_hyperlinks) {
            HyperlinkUnwrapper::unwrap(p);
        }
        SpliceResult result = splicer.splice(p);
        accumulate(result, stats);
        return result.changed();
    };

    for (auto& p : doc.paragraphs) {
        if (process(p)) ++stats.paragraphs_changed;
    }

    for (auto& table : doc.tables) {
        for (auto& row : table.rows) {
            for (auto& cell : row.cells) {
                bool changed = false;
                for (auto& p : cell.paragraphs) {
                    changed = process(p) || changed;
                }
                if (changed) ++stats.table_cells_changed;
            }
        }
    }

    for (auto& section : doc.sections) {
        for (auto* part : {&section.header, &section.footer}) {
            for (auto& p : *part) {
                if (process(p)) ++stats.header_footer_changed;
            }
        }
    }
}

std::pair<Status, SanitizeStats> DocumentSanitizer::sanitizeWith(document::FlowDocument& doc,
                                                                 ReplacementSetBuilder builder) const {
    SanitizeStats stats;
    try {
        if (config_.replace_images) {
            stats.images_replaced = document::ImagePlaceholders::replace(doc).total();
        }

        std::string text = document::TextExtractor::extract(doc);
        stats.safety_net_additions = safety_net_.apply(text, builder);

        ReplacementSet set = builder.build();
        stats.unique_entries = set.size();
        if (set.empty()) {
            DOCSAN_INFO("DocumentSanitizer: No replacements for flow document");
            return {Status::OK(), stats};
        }

        spliceFlow(doc, set, stats);

    } catch (const std::out_of_range& e) {
        DOCSAN_ERROR("DocumentSanitizer: Malformed flow document: {}", e.what());
        return {Status::Error(ErrorCode::MalformedDocument, e.what()), stats};
    } catch (const std::runtime_error& e) {
        // std::regex_error or an ICU search failure
        DOCSAN_ERROR("DocumentSanitizer: Pattern failure: {}", e.what());
        return {Status::Error(ErrorCode::Internal, e.what()), stats};
    }

    DOCSAN_INFO("DocumentSanitizer: Flow document sanitized: {}", stats.toJson().dump());
    return {Status::OK(), stats};
}

std::pair<Status, SanitizeStats> DocumentSanitizer::sanitizeWith(document::IFixedLayoutDocument& doc,
                                                                 ReplacementSetBuilder builder) const {
    SanitizeStats stats;

    auto [extract_status, text] = document::TextExtractor::extract(doc);
    if (!extract_status) {
        DOCSAN_ERROR("DocumentSanitizer: {}", extract_status.message);
        return {extract_status, stats};
    }
    stats.safety_net_additions = safety_net_.apply(text, builder);

    ReplacementSet set = builder.build();
    stats.unique_entries = set.size();
    if (set.empty()) {
        DOCSAN_INFO("DocumentSanitizer: No replacements for fixed-layout document");
        return {Status::OK(), stats};
    }

    Status status;
    try {
        PageRedactionEngine engine(set, config_.page_redaction);
        status = engine.redactDocument(doc, stats);
    } catch (const std::runtime_error& e) {
        DOCSAN_ERROR("DocumentSanitizer: Pattern failure: {}", e.what());
        return {Status::Error(ErrorCode::Internal, e.what()), stats};
    }
    if (!status) {
        return {status, stats};
    }

    DOCSAN_INFO("DocumentSanitizer: Fixed-layout document sanitized: {}", stats.toJson().dump());
    return {Status::OK(), stats};
}

} // namespace sanitizer
} // namespace docsan
